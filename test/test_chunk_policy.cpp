#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lanshare/transfer/chunk_policy.h"
#include "lanshare/transfer/speed_monitor.h"
#include "lanshare/base/config.h"

using namespace lanshare;

TEST_CASE("Adaptive buffer size bands", "[policy][buffer]") {
    REQUIRE(adaptive_buffer_size(0) == 8 * KiB);
    REQUIRE(adaptive_buffer_size(10 * MiB - 1) == 8 * KiB);
    REQUIRE(adaptive_buffer_size(10 * MiB) == 64 * KiB);
    REQUIRE(adaptive_buffer_size(100 * MiB - 1) == 64 * KiB);
    REQUIRE(adaptive_buffer_size(100 * MiB) == 512 * KiB);
    REQUIRE(adaptive_buffer_size(GiB - 1) == 512 * KiB);
    REQUIRE(adaptive_buffer_size(GiB) == MiB);
    REQUIRE(adaptive_buffer_size(20 * GiB) == MiB);
}

TEST_CASE("Multithread threshold", "[policy][threshold]") {
    TransferConfig config;
    ChunkPolicy policy(config);

    REQUIRE_FALSE(policy.should_use_multithread(0));
    REQUIRE_FALSE(policy.should_use_multithread(10 * MiB - 1));
    REQUIRE(policy.should_use_multithread(10 * MiB));

    config.enable_multithread = false;
    ChunkPolicy disabled(config);
    REQUIRE_FALSE(disabled.should_use_multithread(GiB));
}

TEST_CASE("Worker count is bounded and nondecreasing", "[policy][workers]") {
    TransferConfig config;
    config.max_download_threads = 8;
    ChunkPolicy policy(config);

    REQUIRE(policy.optimal_workers(MiB) == 2);
    REQUIRE(policy.optimal_workers(100 * MiB) == 4);
    REQUIRE(policy.optimal_workers(GiB) == 8);

    uint32_t previous = 0;
    for (uint64_t size = 0; size <= 2 * GiB; size += 37 * MiB) {
        uint32_t w = policy.optimal_workers(size);
        REQUIRE(w >= 1);
        REQUIRE(w <= 8);
        REQUIRE(w >= previous);
        previous = w;
    }

    config.max_download_threads = 1;
    ChunkPolicy single(config);
    REQUIRE(single.optimal_workers(GiB) == 1);
    REQUIRE(single.optimal_workers(MiB) == 1);
}

TEST_CASE("Chunk plan covers the file exactly", "[policy][plan]") {
    TransferConfig config;
    ChunkPolicy policy(config);

    SECTION("25 MiB in 2 MiB chunks") {
        auto chunks = policy.plan(25 * MiB);
        REQUIRE(chunks.size() == 13);
        REQUIRE(chunks.front().start_byte == 0);
        REQUIRE(chunks.front().end_byte == 2 * MiB - 1);
        REQUIRE(chunks.back().id == 12);
        REQUIRE(chunks.back().start_byte == 24 * MiB);
        REQUIRE(chunks.back().end_byte == 25 * MiB - 1);
        REQUIRE(chunks.back().size_bytes == MiB);

        uint64_t expected_start = 0;
        uint64_t total = 0;
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            REQUIRE(chunks[i].id == i);
            REQUIRE(chunks[i].start_byte == expected_start);
            REQUIRE(chunks[i].size_bytes == chunks[i].end_byte - chunks[i].start_byte + 1);
            expected_start = chunks[i].end_byte + 1;
            total += chunks[i].size_bytes;
        }
        REQUIRE(total == 25 * MiB);
    }

    SECTION("Exact multiple") {
        auto chunks = policy.plan(4 * MiB);
        REQUIRE(chunks.size() == 2);
        REQUIRE(chunks[1].size_bytes == 2 * MiB);
    }

    SECTION("Empty file") {
        REQUIRE(policy.plan(0).empty());
    }

    SECTION("Smaller than one chunk") {
        auto chunks = policy.plan(100);
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].end_byte == 99);
    }
}

TEST_CASE("Transfer time helpers", "[policy][time]") {
    REQUIRE(estimate_transfer_time(100 * MiB, 10.0) == Catch::Approx(10.0));
    REQUIRE(estimate_transfer_time(100 * MiB, 0.0) == 0.0);
    REQUIRE(format_duration(42) == "42s");
    REQUIRE(format_duration(125) == "2m 5s");
    REQUIRE(format_duration(3720) == "1h 2m");
}

TEST_CASE("Speed monitor keeps a sliding window", "[policy][speed]") {
    SpeedMonitor monitor(3);
    REQUIRE(monitor.average_speed() == 0.0);

    monitor.add_sample(MiB, 1.0);
    monitor.add_sample(2 * MiB, 1.0);
    monitor.add_sample(3 * MiB, 1.0);
    REQUIRE(monitor.average_speed() == Catch::Approx(2.0));

    monitor.add_sample(7 * MiB, 1.0);
    REQUIRE(monitor.sample_count() == 3);
    REQUIRE(monitor.average_speed() == Catch::Approx(4.0));
    REQUIRE(monitor.current_speed() == Catch::Approx(7.0));

    monitor.add_sample(MiB, 0.0);
    REQUIRE(monitor.current_speed() == 0.0);

    monitor.reset();
    REQUIRE(monitor.sample_count() == 0);

    REQUIRE(SpeedMonitor::format_speed(0.5) == "512.0 KB/s");
    REQUIRE(SpeedMonitor::format_speed(12.34) == "12.3 MB/s");
}
