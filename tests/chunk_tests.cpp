// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/chunk.hpp>
#include <ferry/core/config.hpp>
#include <limits>

using namespace ferry::core;

TEST_CASE("plan_chunks empty inputs", "[chunk]") {
    SECTION("Zero total size") {
        CHECK(plan_chunks("out.bin", 0, 1000).empty());
    }

    SECTION("Zero chunk size") {
        CHECK(plan_chunks("out.bin", 4000, 0).empty());
    }

    SECTION("Both zero") {
        CHECK(plan_chunks("out.bin", 0, 0).empty());
    }
}

TEST_CASE("plan_chunks examples", "[chunk]") {
    SECTION("Exact multiple") {
        auto chunks = plan_chunks("out.bin", 4000, 1000);
        REQUIRE(chunks.size() == 4);
        CHECK(chunks[0].start == 0);
        CHECK(chunks[0].end == 999);
        CHECK(chunks[1].start == 1000);
        CHECK(chunks[1].end == 1999);
        CHECK(chunks[2].start == 2000);
        CHECK(chunks[2].end == 2999);
        CHECK(chunks[3].start == 3000);
        CHECK(chunks[3].end == 3999);
    }

    SECTION("Short last chunk") {
        auto chunks = plan_chunks("out.bin", 4500, 1000);
        REQUIRE(chunks.size() == 5);
        CHECK(chunks.back().start == 4000);
        CHECK(chunks.back().end == 4499);
        CHECK(chunks.back().length() == 500);
    }

    SECTION("Chunk larger than file") {
        auto chunks = plan_chunks("out.bin", 10, DEFAULT_CHUNK_SIZE);
        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0].start == 0);
        CHECK(chunks[0].end == 9);
    }

    SECTION("One-byte chunks") {
        auto chunks = plan_chunks("out.bin", 3, 1);
        REQUIRE(chunks.size() == 3);
        CHECK(chunks[2].start == 2);
        CHECK(chunks[2].end == 2);
    }
}

TEST_CASE("plan_chunks coverage", "[chunk]") {
    auto total = GENERATE(as<std::uint64_t>{}, 1, 7, 999, 1000, 1001, 65537, 10'000'019);
    auto size = GENERATE(as<std::uint64_t>{}, 1, 3, 1000, 4096, 8 * 1024 * 1024);

    if (total / size > 100'000) {
        return;
    }

    auto chunks = plan_chunks("out.bin", total, size);
    REQUIRE(chunks.size() == (total + size - 1) / size);
    CHECK(chunks.front().start == 0);
    CHECK(chunks.back().end == total - 1);

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].index == i);
        if (i + 1 < chunks.size()) {
            CHECK(chunks[i].end + 1 == chunks[i + 1].start);
            CHECK(chunks[i].length() == size);
        }
    }
}

TEST_CASE("plan_chunks near the top of the range", "[chunk]") {
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    auto chunks = plan_chunks("out.bin", max, max / 2 + 1);
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[0].end == max / 2);
    CHECK(chunks[1].end == max - 1);
}

TEST_CASE("Part and marker file names", "[chunk]") {
    SECTION("Extension replaced by part index") {
        CHECK(part_path("/data/file.bin", 0) == "/data/file.part0");
        CHECK(part_path("/data/file.bin", 12) == "/data/file.part12");
    }

    SECTION("No extension") {
        CHECK(part_path("download", 3) == "download.part3");
    }

    SECTION("Marker appends .done") {
        CHECK(marker_path("/data/file.part0") == "/data/file.part0.done");
    }

    SECTION("Planned chunks carry both paths") {
        auto chunks = plan_chunks("/data/movie.mkv", 2500, 1000);
        REQUIRE(chunks.size() == 3);
        CHECK(chunks[1].path == "/data/movie.part1");
        CHECK(chunks[1].marker_path == "/data/movie.part1.done");
    }

    SECTION("Stable across calls") {
        auto a = plan_chunks("x.iso", 12345, 1000);
        auto b = plan_chunks(DownloadTask{"http://h/x.iso", "x.iso", 12345, 1000});
        REQUIRE(a.size() == b.size());
        for (std::size_t i = 0; i < a.size(); ++i) {
            CHECK(a[i].path == b[i].path);
            CHECK(a[i].start == b[i].start);
        }
    }
}
