#include "core/TimeUtils.hpp"

#include <doctest/doctest.h>

#include <chrono>

using namespace HC;

TEST_SUITE("core.time") {
    TEST_CASE("parse_timestamp accepts source formats") {
        auto utc = parse_timestamp("2024-03-01T12:00:00+00:00");
        REQUIRE(utc.has_value());
        CHECK(format_timestamp(*utc) == "2024-03-01T12:00:00.000Z");

        auto fractional = parse_timestamp("2024-03-01T12:00:00.123456+00:00");
        REQUIRE(fractional.has_value());
        CHECK(*fractional - *utc == std::chrono::microseconds{123456});

        auto zulu = parse_timestamp("2024-03-01T12:00:00Z");
        REQUIRE(zulu.has_value());
        CHECK(*zulu == *utc);

        auto no_offset = parse_timestamp("2024-03-01T12:00:00");
        REQUIRE(no_offset.has_value());
        CHECK(*no_offset == *utc);
    }

    TEST_CASE("parse_timestamp applies offsets") {
        auto east = parse_timestamp("2024-03-01T14:00:00+02:00");
        auto utc  = parse_timestamp("2024-03-01T12:00:00Z");
        auto west = parse_timestamp("2024-03-01T07:30:00-04:30");
        REQUIRE(east.has_value());
        REQUIRE(utc.has_value());
        REQUIRE(west.has_value());
        CHECK(*east == *utc);
        CHECK(*west == *utc);
    }

    TEST_CASE("parse_timestamp rejects malformed text") {
        for (auto text : {"", "yesterday", "2024-13-01T00:00:00Z", "2024-02-30T00:00:00Z",
                          "2024-03-01T25:00:00Z", "2024-03-01T12:00:00.Z", "2024-03-01T12:00:00Q"}) {
            CAPTURE(text);
            auto parsed = parse_timestamp(text);
            REQUIRE_FALSE(parsed.has_value());
            CHECK(parsed.error().code == Error::Code::MalformedInput);
        }
    }

    TEST_CASE("format_timestamp keeps millisecond precision") {
        auto base = parse_timestamp("2023-12-31T23:59:59Z");
        REQUIRE(base.has_value());
        CHECK(format_timestamp(*base + std::chrono::milliseconds{42}) == "2023-12-31T23:59:59.042Z");
    }
}
