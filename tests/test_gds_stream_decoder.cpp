/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include <catch2/catch_test_macros.hpp>

#include "gds/gds_error.h"
#include "gds/gds_json.h"
#include "gds/gds_stream_decoder.h"
#include "test_helpers.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace gds::stream;
using namespace gds::test;

TEST_CASE("HEADER followed by ENDLIB", "[stream]") {
    const auto bytes = header_and_endlib();
    StreamDecoder decoder(bytes, RecordNameTable::standard());
    REQUIRE(decoder.state() == DecoderState::Reading);

    const DecodedStream out = decoder.run();

    REQUIRE(decoder.state() == DecoderState::Done);
    REQUIRE(out.records.size() == 2);
    REQUIRE(out.records[0].name == "HEADER");
    REQUIRE(std::get<std::int16_t>(out.records[0].values.at(0)) == 600);
    REQUIRE(out.records[1].name == "ENDLIB");
    REQUIRE(out.records[1].values.empty());
    REQUIRE(out.bytes_consumed == bytes.size());
    REQUIRE(out.trailing_bytes == 0);
}

TEST_CASE("minimal library decodes in order", "[stream]") {
    const auto bytes = minimal_library();
    const DecodedStream out = decode_stream(bytes);

    std::vector<std::string> names;
    for (const auto& rec : out.records) {
        names.push_back(rec.name);
    }
    REQUIRE(
        names
        == std::vector<std::string>{
            "HEADER", "BGNLIB", "LIBNAME", "UNITS", "BGNSTR", "STRNAME", "BOUNDARY", "LAYER",
            "DATATYPE", "XY", "ENDEL", "ENDSTR", "ENDLIB"
        }
    );

    const auto& xy = out.records[9];
    REQUIRE(xy.data_type == DataType::Int32);
    REQUIRE(xy.values.size() == 10);
    REQUIRE(std::get<std::int32_t>(xy.values[4]) == 1000);
    REQUIRE(std::get<std::int32_t>(xy.values[5]) == 500);

    std::size_t expected_offset = 0;
    for (const auto& rec : out.records) {
        REQUIRE(rec.offset == expected_offset);
        expected_offset += static_cast<std::size_t>(rec.length);
    }
    REQUIRE(expected_offset == bytes.size());
}

TEST_CASE("records after ENDLIB are not decoded", "[stream]") {
    auto bytes = header_and_endlib();
    // Tape block padding, then garbage that would fail to decode.
    bytes.insert(bytes.end(), 6, 0x00);
    bytes.push_back(0xFF);

    const DecodedStream out = decode_stream(bytes);
    REQUIRE(out.records.size() == 2);
    REQUIRE(out.bytes_consumed == 10);
    REQUIRE(out.trailing_bytes == 7);
}

TEST_CASE("missing terminator is fatal", "[stream]") {
    std::vector<std::uint8_t> bytes;
    append_record(bytes, 0x00, 0x02, be16({600}));
    append_record(bytes, 0x01, 0x02, be16({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}));

    StreamDecoder decoder(bytes, RecordNameTable::standard());
    try {
        (void)decoder.run();
        FAIL("expected MissingTerminator");
    } catch (const DecodeError& e) {
        REQUIRE(e.kind() == ErrorKind::MissingTerminator);
        REQUIRE(e.offset() == bytes.size());
        REQUIRE(e.record_index() == 2);
    }
    REQUIRE(decoder.state() == DecoderState::Error);
    REQUIRE(decoder.records().size() == 2);
    REQUIRE_THROWS_AS(decoder.run(), std::logic_error);
}

TEST_CASE("unknown record type is fatal", "[stream]") {
    std::vector<std::uint8_t> bytes;
    append_record(bytes, 0x00, 0x02, be16({600}));
    append_record(bytes, 0x14, 0x00);
    append_record(bytes, 0x04, 0x00);

    StreamDecoder decoder(bytes, RecordNameTable::standard());
    try {
        (void)decoder.run();
        FAIL("expected UnknownRecordType");
    } catch (const DecodeError& e) {
        REQUIRE(e.kind() == ErrorKind::UnknownRecordType);
        REQUIRE(e.offset() == 6);
        REQUIRE(e.record_index() == 1);
    }
    REQUIRE(decoder.state() == DecoderState::Error);
    REQUIRE(decoder.records().size() == 1);
}

TEST_CASE("decode errors abort the whole run", "[stream]") {
    SECTION("corrupt length in the middle of the stream") {
        std::vector<std::uint8_t> bytes;
        append_record(bytes, 0x00, 0x02, be16({600}));
        bytes.insert(bytes.end(), {0x00, 0x07, 0x0D, 0x02, 0x00, 0x01, 0x00});
        append_record(bytes, 0x04, 0x00);

        StreamDecoder decoder(bytes, RecordNameTable::standard());
        REQUIRE_THROWS_AS(decoder.run(), DecodeError);
        REQUIRE(decoder.state() == DecoderState::Error);
        REQUIRE(decoder.records().size() == 1);
    }

    SECTION("short tail instead of a header") {
        auto bytes = header_and_endlib();
        bytes.resize(8);
        try {
            (void)decode_stream(bytes);
            FAIL("expected MalformedHeader");
        } catch (const DecodeError& e) {
            REQUIRE(e.kind() == ErrorKind::MalformedHeader);
            REQUIRE(e.record_index() == 1);
        }
    }

    SECTION("empty source") {
        try {
            (void)decode_stream(std::vector<std::uint8_t>{});
            FAIL("expected MissingTerminator");
        } catch (const DecodeError& e) {
            REQUIRE(e.kind() == ErrorKind::MissingTerminator);
            REQUIRE(e.offset() == 0);
        }
    }
}

TEST_CASE("record callback sees records in stream order", "[stream]") {
    const auto bytes = minimal_library();
    std::vector<std::size_t> offsets;
    const DecodedStream out =
        decode_stream(bytes, RecordNameTable::standard(), [&](const DecodedRecord& rec) {
            offsets.push_back(rec.offset);
        });
    REQUIRE(offsets.size() == out.records.size());
    for (std::size_t i = 0; i < offsets.size(); i++) {
        REQUIRE(offsets[i] == out.records[i].offset);
    }
}

TEST_CASE("decoding the same bytes twice is identical", "[stream]") {
    const auto bytes = minimal_library();
    const auto first = stream_to_json(decode_stream(bytes)).dump();
    const auto second = stream_to_json(decode_stream(bytes)).dump();
    REQUIRE(first == second);
}
