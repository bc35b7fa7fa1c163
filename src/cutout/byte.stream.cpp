#include "byte.stream.hh"

#include <algorithm>
#include <cstring>

bool
dvid::finalize_sink(Sink& sink)
{
    return sink.flush_();
}

size_t
dvid::read_fully(Source& source, std::span<std::byte> buf)
{
    size_t bytes_read = 0;
    while (bytes_read < buf.size()) {
        const auto n = source.read(buf.subspan(bytes_read));
        if (n == 0) {
            break;
        }
        bytes_read += n;
    }

    return bytes_read;
}

bool
dvid::BufferSink::write(size_t offset, std::span<const std::byte> buf)
{
    if (buf.empty()) {
        return true;
    }

    if (offset + buf.size() > buffer_.size()) {
        buffer_.resize(offset + buf.size());
    }
    std::memcpy(buffer_.data() + offset, buf.data(), buf.size());
    return true;
}

bool
dvid::BufferSink::flush_()
{
    return true;
}

dvid::BufferSource::BufferSource(std::span<const std::byte> data,
                                 size_t max_read_size)
  : data_{ data }
  , offset_{ 0 }
  , max_read_size_{ max_read_size }
{
}

dvid::BufferSource::BufferSource(std::string_view text, size_t max_read_size)
  : BufferSource(std::as_bytes(std::span(text.data(), text.size())),
                 max_read_size)
{
}

size_t
dvid::BufferSource::read(std::span<std::byte> buf)
{
    auto n = std::min(buf.size(), bytes_remaining());
    if (max_read_size_ > 0) {
        n = std::min(n, max_read_size_);
    }

    if (n > 0) {
        std::memcpy(buf.data(), data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}
