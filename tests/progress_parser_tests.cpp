// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/stream/progress_parser.hpp>

using namespace ferry::stream;

TEST_CASE("ProgressParser accumulation", "[progress_parser]") {
    ProgressParser parser;

    SECTION("Plain keys accumulate silently") {
        CHECK_FALSE(parser.feed("frame=10"));
        CHECK_FALSE(parser.feed("fps=25.0"));
        CHECK(parser.current().size() == 2);
        CHECK(parser.current().at("frame") == "10");
    }

    SECTION("out_time_ms emits immediately") {
        CHECK_FALSE(parser.feed("frame=10"));
        auto sample = parser.feed("out_time_ms=1500000");
        REQUIRE(sample);
        CHECK(sample->at("frame") == "10");
        CHECK(sample->at("out_time_ms") == "1500000");
    }

    SECTION("progress emits immediately") {
        auto sample = parser.feed("progress=continue");
        REQUIRE(sample);
        CHECK(sample->at("progress") == "continue");
    }

    SECTION("Later values overwrite earlier ones") {
        (void)parser.feed("out_time_ms=1000");
        auto sample = parser.feed("out_time_ms=2000");
        REQUIRE(sample);
        CHECK(sample->at("out_time_ms") == "2000");
    }

    SECTION("Whitespace and CR are trimmed") {
        (void)parser.feed("  speed = 1.5x \r");
        CHECK(parser.current().at("speed") == "1.5x");
    }

    SECTION("Value may contain '='") {
        (void)parser.feed("meta=a=b");
        CHECK(parser.current().at("meta") == "a=b");
    }
}

TEST_CASE("ProgressParser record boundaries", "[progress_parser]") {
    ProgressParser parser;

    SECTION("Blank line with nothing seen emits nothing") {
        CHECK_FALSE(parser.feed(""));
        CHECK_FALSE(parser.feed("\r"));
    }

    SECTION("Blank line emits the running sample") {
        (void)parser.feed("bitrate=100kbits/s");
        auto sample = parser.feed("");
        REQUIRE(sample);
        CHECK(sample->at("bitrate") == "100kbits/s");
    }

    SECTION("Fields survive blank lines") {
        (void)parser.feed("frame=1");
        (void)parser.feed("");
        auto sample = parser.feed("out_time_ms=5");
        REQUIRE(sample);
        CHECK(sample->count("frame") == 1);
        CHECK(sample->count("out_time_ms") == 1);
    }

    SECTION("Lines without '=' and empty keys are ignored") {
        CHECK_FALSE(parser.feed("garbage"));
        CHECK_FALSE(parser.feed("=value"));
        CHECK(parser.empty());
    }
}

TEST_CASE("ProgressParser::is_progress_key", "[progress_parser]") {
    CHECK(ProgressParser::is_progress_key("out_time_ms"));
    CHECK(ProgressParser::is_progress_key("progress"));
    CHECK_FALSE(ProgressParser::is_progress_key("out_time"));
    CHECK_FALSE(ProgressParser::is_progress_key("frame"));
}
