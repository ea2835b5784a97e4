/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include <catch2/catch_test_macros.hpp>

#include "gds/gds_json.h"
#include "test_helpers.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace gds::stream;
using namespace gds::test;

TEST_CASE("value_to_json", "[json]") {
    REQUIRE(value_to_json(DecodedValue{}).is_null());
    REQUIRE(value_to_json(DecodedValue{std::int16_t{-5}}) == -5);
    REQUIRE(value_to_json(DecodedValue{std::int32_t{70000}}) == 70000);
    REQUIRE(value_to_json(DecodedValue{1.5f}).get<double>() == 1.5);
    REQUIRE(value_to_json(DecodedValue{0.25}).get<double>() == 0.25);
    REQUIRE(value_to_json(DecodedValue{'A'}) == "A");
}

TEST_CASE("stream_to_json builds name/value pairs", "[json]") {
    const auto doc = stream_to_json(decode_stream(header_and_endlib()));
    const auto expected = nlohmann::ordered_json::parse(R"([["HEADER", [600]], ["ENDLIB", []]])");
    REQUIRE(doc == expected);
}

TEST_CASE("Ascii records become one string per character", "[json]") {
    DecodedRecord rec{};
    rec.name = "STRNAME";
    rec.record_type = 0x06;
    rec.data_type = DataType::Ascii;
    for (const char c : std::string("A\xC3\xA9\0", 4)) {
        rec.values.emplace_back(c);
    }

    const auto doc = record_to_json(rec);
    REQUIRE(doc.size() == 2);
    REQUIRE(doc[0] == "STRNAME");
    const auto& chars = doc[1];
    REQUIRE(chars.size() == 3);
    REQUIRE(chars[0] == "A");
    REQUIRE(chars[1] == "\xC3\xA9");
    REQUIRE(chars[2] == std::string(1, '\0'));
    REQUIRE_NOTHROW(doc.dump());
}

TEST_CASE("UNITS record serializes as doubles", "[json]") {
    const auto doc = stream_to_json(decode_stream(minimal_library()));
    const auto& units = doc.at(3);
    REQUIRE(units.at(0) == "UNITS");
    REQUIRE(units.at(1).size() == 2);
    REQUIRE(units.at(1).at(0).is_number_float());
}

TEST_CASE("non-finite Real32 values serialize as null", "[json]") {
    std::vector<std::uint8_t> bytes;
    append_record(bytes, 0x00, 0x02, be16({600}));
    // quiet NaN, +Inf
    append_record(bytes, 0x1B, 0x04, {0x7F, 0xC0, 0x00, 0x00, 0x7F, 0x80, 0x00, 0x00});
    append_record(bytes, 0x04, 0x00);

    const auto out = decode_stream(bytes);
    const auto& mag = out.records.at(1);
    REQUIRE(std::isnan(std::get<float>(mag.values.at(0))));
    REQUIRE(std::get<float>(mag.values.at(1)) == std::numeric_limits<float>::infinity());

    const auto doc = record_to_json(mag);
    REQUIRE(doc.at(1).size() == 2);
    REQUIRE(doc.at(1).at(0).dump() == "null");
    REQUIRE(doc.at(1).at(1).dump() == "null");
    REQUIRE(doc.dump() == R"(["MAG",[null,null]])");
}
