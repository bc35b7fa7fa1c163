#pragma once

#include <cstddef> // size_t, std::byte
#include <span>    // std::span
#include <string>
#include <string_view>
#include <utility> // std::move

namespace dvid {
/// A destination for the bytes of a response body.
class Sink
{
  public:
    virtual ~Sink() = default;

    /**
     * @brief Write data to the sink.
     * @param offset The offset in the sink to write to.
     * @param buf The buffer to write to the sink.
     * @return True if the write was successful, false otherwise.
     */
    [[nodiscard]] virtual bool write(size_t offset,
                                     std::span<const std::byte> buf) = 0;

  protected:
    /// Called once, after the last byte of the body has been written.
    [[nodiscard]] virtual bool flush_() = 0;

    friend bool finalize_sink(Sink& sink);
};

/**
 * @brief Signal the end of the body to @p sink.
 * @return True if the sink accepted the body, false otherwise.
 */
bool
finalize_sink(Sink& sink);

/// An origin for the bytes of a request body.
class Source
{
  public:
    virtual ~Source() = default;

    /**
     * @brief Read up to buf.size() bytes from the source.
     * @param buf The buffer to read into.
     * @return The number of bytes read. Zero means the source is exhausted.
     */
    [[nodiscard]] virtual size_t read(std::span<std::byte> buf) = 0;
};

/**
 * @brief Read from @p source until @p buf is full or the source is exhausted.
 * @return The number of bytes read.
 */
size_t
read_fully(Source& source, std::span<std::byte> buf);

/// Collects a body in memory, e.g., a JSON document.
class BufferSink : public Sink
{
  public:
    bool write(size_t offset, std::span<const std::byte> buf) override;

    const std::string& str() const noexcept { return buffer_; }

  protected:
    bool flush_() override;

  private:
    std::string buffer_;
};

/// Serves a body from memory it does not own.
class BufferSource : public Source
{
  public:
    /**
     * @param data The bytes to serve.
     * @param max_read_size If nonzero, a bound on the bytes returned by a
     * single read.
     */
    explicit BufferSource(std::span<const std::byte> data,
                          size_t max_read_size = 0);
    explicit BufferSource(std::string_view text, size_t max_read_size = 0);

    size_t read(std::span<std::byte> buf) override;

    size_t bytes_remaining() const noexcept { return data_.size() - offset_; }

  private:
    std::span<const std::byte> data_;
    size_t offset_;
    size_t max_read_size_;
};
} // namespace dvid
