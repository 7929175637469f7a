#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <vector>

TEST_CASE("RingBuffer", "[ring_buffer]") {
    constexpr size_t cap = 256;
    RingBuffer rb(cap);

    SECTION("WriteAndRead") {
        std::vector<uint8_t> data(64);
        std::iota(data.begin(), data.end(), uint8_t(0));

        REQUIRE(rb.write(data.data(), data.size()) == 64);
        REQUIRE(rb.available() == 64);

        std::vector<uint8_t> out(64);
        REQUIRE(rb.read(out.data(), out.size()) == 64);
        REQUIRE(out == data);
    }

    SECTION("Wraparound") {
        std::vector<uint8_t> fill(200);
        std::iota(fill.begin(), fill.end(), uint8_t(1));
        REQUIRE(rb.write(fill.data(), fill.size()) == 200);

        std::vector<uint8_t> sink(200);
        REQUIRE(rb.read(sink.data(), sink.size()) == 200);

        // Positions sit at 200; 128 bytes cross the end of storage.
        std::vector<uint8_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), uint8_t(42));
        REQUIRE(rb.write(wrap.data(), wrap.size()) == 128);

        std::vector<uint8_t> out(128);
        REQUIRE(rb.read(out.data(), out.size()) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("OverflowCountsOverrun") {
        std::vector<uint8_t> big(cap + 100, 0xAB);

        REQUIRE(rb.write(big.data(), big.size()) == cap);
        REQUIRE(rb.available() == cap);
        REQUIRE(rb.overrun_bytes() == 100);

        REQUIRE(rb.write(big.data(), 10) == 0);
        REQUIRE(rb.overrun_bytes() == 110);
    }

    SECTION("ReadSamplesIsAllOrNothing") {
        std::vector<int16_t> samples = {100, -200, 300};
        rb.write(samples.data(), samples.size() * sizeof(int16_t));
        REQUIRE(rb.available_samples() == 3);

        std::vector<int16_t> four(4);
        REQUIRE_FALSE(rb.read_samples(four));
        REQUIRE(rb.available_samples() == 3);

        std::vector<int16_t> three(3);
        REQUIRE(rb.read_samples(three));
        REQUIRE(three == samples);
        REQUIRE(rb.available() == 0);
    }

    SECTION("OddByteCountLeavesPartialSample") {
        std::vector<uint8_t> odd(7, 0x01);
        rb.write(odd.data(), odd.size());

        REQUIRE(rb.available_samples() == 3);
        std::vector<int16_t> out(3);
        REQUIRE(rb.read_samples(out));
        REQUIRE(rb.available() == 1);
    }

    SECTION("DiscardDropsBufferedData") {
        std::vector<uint8_t> data(80, 0x11);
        rb.write(data.data(), data.size());
        rb.discard();
        REQUIRE(rb.available() == 0);

        // Still usable afterwards.
        REQUIRE(rb.write(data.data(), 20) == 20);
        REQUIRE(rb.available() == 20);
    }

    SECTION("EmptyRead") {
        uint8_t buf[16];
        REQUIRE(rb.read(buf, sizeof(buf)) == 0);
    }

    SECTION("ResetClearsState") {
        std::vector<uint8_t> data(cap + 8, 0xFF);
        rb.write(data.data(), data.size());
        REQUIRE(rb.available() == cap);
        REQUIRE(rb.overrun_bytes() == 8);

        rb.reset();
        REQUIRE(rb.available() == 0);
        REQUIRE(rb.overrun_bytes() == 0);
    }

    SECTION("MultipleWriteRead") {
        for (int round = 0; round < 20; ++round) {
            std::vector<uint8_t> data(20, static_cast<uint8_t>(round));
            REQUIRE(rb.write(data.data(), data.size()) == 20);
            std::vector<uint8_t> out(20);
            REQUIRE(rb.read(out.data(), out.size()) == 20);
            REQUIRE(out == data);
        }
        REQUIRE(rb.available() == 0);
    }
}
