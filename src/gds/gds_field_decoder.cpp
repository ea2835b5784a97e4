/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_field_decoder.h"
#include "gds/gds_error.h"
#include "gds/gds_real.h"
#include "gds/gds_utf8.h"

#include <bit>
#include <string>

namespace gds::stream {

static std::uint16_t read_u16_be(std::span<const std::uint8_t> s) {
    return static_cast<std::uint16_t>(
        (static_cast<std::uint16_t>(s[0]) << 8) | static_cast<std::uint16_t>(s[1])
    );
}

static std::uint32_t read_u32_be(std::span<const std::uint8_t> s) {
    return (static_cast<std::uint32_t>(s[0]) << 24) | (static_cast<std::uint32_t>(s[1]) << 16)
           | (static_cast<std::uint32_t>(s[2]) << 8) | static_cast<std::uint32_t>(s[3]);
}

std::vector<DecodedValue> decode_fields(const Record& rec, std::size_t record_index) {
    std::vector<DecodedValue> out;
    const std::size_t count = rec.element_count();

    switch (rec.data_type) {
        case DataType::NoData:
        case DataType::BitArray:
            return out;

        case DataType::Int16:
            out.reserve(count);
            for (std::size_t i = 0; i < count; i++) {
                out.emplace_back(static_cast<std::int16_t>(read_u16_be(rec.element(i))));
            }
            return out;

        case DataType::Int32:
            out.reserve(count);
            for (std::size_t i = 0; i < count; i++) {
                out.emplace_back(static_cast<std::int32_t>(read_u32_be(rec.element(i))));
            }
            return out;

        case DataType::Real32:
            out.reserve(count);
            for (std::size_t i = 0; i < count; i++) {
                out.emplace_back(std::bit_cast<float>(read_u32_be(rec.element(i))));
            }
            return out;

        case DataType::Real64:
            out.reserve(count);
            for (std::size_t i = 0; i < count; i++) {
                out.emplace_back(real8_to_double(rec.element(i).first<8>()));
            }
            return out;

        case DataType::Ascii:
            break;
    }

    if (const auto bad = utf8::find_invalid(rec.payload); bad.has_value()) {
        const std::uint8_t b = rec.payload[*bad];
        throw DecodeError(
            ErrorKind::InvalidEncoding, rec.offset + kRecordHeaderSize + *bad, record_index,
            "byte " + std::to_string(static_cast<unsigned>(b)) + " is not valid UTF-8"
        );
    }
    out.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
        out.emplace_back(static_cast<char>(rec.element(i)[0]));
    }
    return out;
}

std::string values_to_text(const std::vector<DecodedValue>& values) {
    std::string text;
    text.reserve(values.size());
    for (const auto& v : values) {
        if (const auto* c = std::get_if<char>(&v)) {
            text.push_back(*c);
        }
    }
    return text;
}

}  // namespace gds::stream
