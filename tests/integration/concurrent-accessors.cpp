#include "mock.fixture.hh"
#include "test.macros.hh"
#include "volume.accessor.hh"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {
constexpr size_t n_volumes = 6;
constexpr size_t n_connections = 3;
} // namespace

int
main()
{
    int retval = 0;

    try {
        MockFixture fixture(n_connections, 1 << 12);
        const auto metadata = dvid::VolumeMetadata::default_metadata(
          { 2, 32, 32, 32 }, DvidDataType_uint16, "cxyz", 1.0, "nanometers");
        for (size_t i = 0; i < n_volumes; ++i) {
            fixture.add_volume(
              "test", "uuid1", "volume" + std::to_string(i), metadata);
        }

        std::atomic<size_t> failures{ 0 };
        std::vector<std::thread> threads;
        for (size_t i = 0; i < n_volumes; ++i) {
            threads.emplace_back([&fixture, &failures, i]() {
                try {
                    dvid::VolumeAccessor accessor(
                      fixture.pool, "uuid1", "volume" + std::to_string(i));
                    const auto value = static_cast<uint16_t>(100 + i);
                    const auto data = dvid::NdArray::full<uint16_t>(
                      { 2, 16, 16, 16 }, value);

                    for (int64_t z = 0; z < 32; z += 16) {
                        accessor.post_subvolume(
                          { 0, 8, 8, z }, { 2, 16, 16, 16 }, data);
                    }

                    const auto read =
                      accessor.get_subvolume({ 0, 8, 8, 0 }, { 2, 16, 16, 32 });
                    for (const auto v : read.values<uint16_t>()) {
                        EXPECT_EQ(int, v, value);
                    }
                } catch (const std::exception& e) {
                    LOG_ERROR("Volume ", i, ": ", e.what());
                    ++failures;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        EXPECT_EQ(size_t, failures.load(), 0);
        EXPECT_EQ(size_t, fixture.engine.requests_in_flight(), 0);
        EXPECT_EQ(size_t, fixture.pool->size(), n_connections);

        // volumes did not bleed into each other
        dvid::VolumeAccessor first(fixture.pool, "uuid1", "volume0");
        EXPECT_EQ(int,
                  (first.get_subvolume({ 1, 10, 10, 10 }, { 1, 1, 1, 1 })
                     .at<uint16_t>({ 0, 0, 0, 0 })),
                  100);
        EXPECT_EQ(int,
                  (first.get_subvolume({ 1, 0, 0, 0 }, { 1, 1, 1, 1 })
                     .at<uint16_t>({ 0, 0, 0, 0 })),
                  0);
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
