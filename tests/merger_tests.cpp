// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/config.hpp>
#include <ferry/disk/merger.hpp>
#include "support/scratch_dir.hpp"
#include <filesystem>

using namespace ferry::disk;
using ferry::test::ScratchDir;
using ferry::test::read_file;
using ferry::test::write_file;

namespace fs = std::filesystem;

TEST_CASE("merge_files concatenation", "[merger]") {
    ScratchDir dir;
    auto output = dir / "out.txt";

    SECTION("Two parts in order") {
        write_file(dir / "out.part0", "Hello ");
        write_file(dir / "out.part1", "World!");
        REQUIRE_FALSE(merge_files({dir / "out.part0", dir / "out.part1"}, output));
        CHECK(read_file(output) == "Hello World!");
    }

    SECTION("List order wins over file names") {
        write_file(dir / "a", "World!");
        write_file(dir / "b", "Hello ");
        REQUIRE_FALSE(merge_files({dir / "b", dir / "a"}, output));
        CHECK(read_file(output) == "Hello World!");
    }

    SECTION("Boundaries do not matter") {
        write_file(dir / "p0", "Hel");
        write_file(dir / "p1", "");
        write_file(dir / "p2", "lo Wor");
        write_file(dir / "p3", "ld!");
        REQUIRE_FALSE(merge_files({dir / "p0", dir / "p1", dir / "p2", dir / "p3"}, output));
        CHECK(read_file(output) == "Hello World!");
    }

    SECTION("Parts larger than the copy buffer") {
        auto big = ferry::test::make_payload(ferry::core::MERGE_BUFFER_SIZE * 2 + 123);
        write_file(dir / "big0", big);
        write_file(dir / "big1", "tail");
        REQUIRE_FALSE(merge_files({dir / "big0", dir / "big1"}, output));
        CHECK(read_file(output) == big + "tail");
    }

    SECTION("Existing output is truncated") {
        write_file(output, "old content that is longer");
        write_file(dir / "p0", "new");
        REQUIRE_FALSE(merge_files({dir / "p0"}, output));
        CHECK(read_file(output) == "new");
    }
}

TEST_CASE("merge_files edge cases", "[merger]") {
    ScratchDir dir;
    auto output = dir / "out.bin";

    SECTION("Empty list gives empty file") {
        REQUIRE_FALSE(merge_files({}, output));
        REQUIRE(fs::exists(output));
        CHECK(fs::file_size(output) == 0);
    }

    SECTION("Missing part fails") {
        write_file(dir / "p0", "data");
        auto ec = merge_files({dir / "p0", dir / "missing"}, output);
        CHECK(ec == DiskErrc::file_not_found);
    }

    SECTION("Parts are left in place") {
        write_file(dir / "p0", "data");
        REQUIRE_FALSE(merge_files({dir / "p0"}, output));
        CHECK(fs::exists(dir / "p0"));
    }
}
