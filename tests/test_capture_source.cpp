#include <catch2/catch_test_macros.hpp>

#include "capture_source.hpp"
#include "fakes.hpp"

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

namespace {

// 10 ms at 16 kHz mono = 160 samples per chunk.
constexpr CaptureFormat kFormat{.sample_rate = 16000, .channels = 1, .chunk_ms = 10};

const DeviceDescriptor kMic{.id = "mic-a", .name = "Mic A", .sample_rates = {}, .channels = 1,
                            .is_default = true};

std::vector<int16_t> samples(size_t n, int16_t value) {
    return std::vector<int16_t>(n, value);
}

} // namespace

TEST_CASE("CaptureSource", "[capture]") {
    RingBuffer ring(16000 * sizeof(int16_t));
    FakeAudioCapture device(ring);
    ChunkQueue queue(100);
    CaptureSource source(device, ring, queue);

    SECTION("CutsFixedSizeChunksWithGapFreeSequence") {
        queue.reset(1);
        REQUIRE(source.open(kMic, kFormat, 1));
        REQUIRE(source.is_open());
        REQUIRE(device.is_capturing());

        for (int16_t i = 0; i < 3; ++i) REQUIRE(device.feed(samples(160, i)));
        REQUIRE(device.feed(samples(80, 99)));  // half a chunk stays behind

        REQUIRE(wait_until([&] { return queue.size() == 3; }));
        std::this_thread::sleep_for(20ms);
        REQUIRE(queue.size() == 3);

        for (uint64_t i = 0; i < 3; ++i) {
            auto c = queue.pop(10ms);
            REQUIRE(c);
            REQUIRE(c->capture_session == 1);
            REQUIRE(c->seq == i);
            REQUIRE(c->sample_rate == 16000);
            REQUIRE(c->samples.size() == 160);
            REQUIRE(c->samples.front() == static_cast<int16_t>(i));
        }
    }

    SECTION("CloseReleasesDeviceAndIsIdempotent") {
        queue.reset(1);
        REQUIRE(source.open(kMic, kFormat, 1));
        source.close();
        REQUIRE_FALSE(source.is_open());
        REQUIRE_FALSE(device.is_capturing());
        source.close();
        REQUIRE_FALSE(source.is_open());
    }

    SECTION("NewSessionRestartsSequence") {
        queue.reset(1);
        REQUIRE(source.open(kMic, kFormat, 1));
        REQUIRE(device.feed(samples(320, 1)));
        REQUIRE(wait_until([&] { return source.chunks_produced() == 2; }));
        source.close();

        queue.reset(2);
        REQUIRE(source.open(kMic, kFormat, 2));
        REQUIRE(source.capture_session() == 2);
        REQUIRE(device.feed(samples(160, 2)));
        REQUIRE(wait_until([&] { return queue.size() == 1; }));

        auto c = queue.pop(10ms);
        REQUIRE(c);
        REQUIRE(c->capture_session == 2);
        REQUIRE(c->seq == 0);
    }

    SECTION("ChunksOfStaleSessionAreNotQueued") {
        queue.reset(5);
        REQUIRE(source.open(kMic, kFormat, 4));
        REQUIRE(device.feed(samples(160, 1)));
        std::this_thread::sleep_for(30ms);
        REQUIRE(queue.size() == 0);
    }

    SECTION("DeviceOpenFailure") {
        device.fail_open = true;
        auto res = source.open(kMic, kFormat, 1);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::DeviceOpen);
        REQUIRE_FALSE(source.is_open());
    }

    SECTION("ChunkLargerThanRingIsRejected") {
        CaptureFormat huge{.sample_rate = 16000, .channels = 1, .chunk_ms = 2000};
        auto res = source.open(kMic, huge, 1);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::DeviceOpen);
        REQUIRE(device.opens() == 0);
    }
}
