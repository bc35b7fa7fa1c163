#include "cutout.codec.hh"
#include "unit.test.macros.hh"

#include <vector>

using dvid::OversizedPayloadError;
using dvid::TruncatedPayloadError;

int
main()
{
    int retval = 0;

    try {
        const std::vector<size_t> shape{ 2, 10, 10 };
        std::vector<std::byte> payload(200, std::byte{ 1 });

        // the source ends early
        {
            dvid::BufferSource source{ std::span(payload).first(150), 16 };
            EXPECT_THROWS(TruncatedPayloadError,
                          dvid::decode_stream(
                            source, shape, DvidDataType_uint8, 64));
        }

        // the source has bytes left over
        {
            payload.push_back(std::byte{ 1 });
            dvid::BufferSource source(payload, 16);
            EXPECT_THROWS(OversizedPayloadError,
                          dvid::decode_stream(
                            source, shape, DvidDataType_uint8, 64));
            payload.pop_back();
        }

        // a source that serves short reads still decodes
        {
            dvid::BufferSource source(payload, 7);
            const auto array =
              dvid::decode_stream(source, shape, DvidDataType_uint8, 64);
            EXPECT_EQ(size_t, array.bytes_of_data(), 200);
            EXPECT_EQ(int, array.at<uint8_t>({ 1, 9, 9 }), 1);
        }

        // push mode
        {
            dvid::CutoutDecoder decoder(shape, DvidDataType_uint8);
            const std::span<const std::byte> bytes(payload);

            CHECK(decoder.write(0, bytes.first(100)));
            CHECK(!decoder.is_complete());

            // out of order
            CHECK(!decoder.write(150, bytes.subspan(150)));
            EXPECT_EQ(size_t, decoder.bytes_received(), 100);

            // truncated
            EXPECT_THROWS(TruncatedPayloadError, dvid::finalize_sink(decoder));

            // resumes where it left off
            CHECK(decoder.write(100, bytes.subspan(100, 60)));
            CHECK(decoder.write(160, bytes.subspan(160)));
            CHECK(decoder.is_complete());

            // overflow
            EXPECT_THROWS(OversizedPayloadError,
                          decoder.write(200, bytes.first(1)));

            CHECK(dvid::finalize_sink(decoder));
            const auto array = decoder.take();
            CHECK((array.shape() == shape));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
