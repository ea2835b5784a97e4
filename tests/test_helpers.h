/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace gds::test {

// Appends one framed record: [len:2][type:1][data:1][payload].
inline void append_record(
    std::vector<std::uint8_t>& out,
    std::uint8_t record_type,
    std::uint8_t data_type,
    const std::vector<std::uint8_t>& payload = {}
) {
    const auto len = static_cast<std::uint16_t>(payload.size() + 4);
    out.push_back(static_cast<std::uint8_t>(len >> 8));
    out.push_back(static_cast<std::uint8_t>(len & 0xFFu));
    out.push_back(record_type);
    out.push_back(data_type);
    out.insert(out.end(), payload.begin(), payload.end());
}

inline std::vector<std::uint8_t> be16(std::initializer_list<std::int16_t> values) {
    std::vector<std::uint8_t> out;
    for (const auto v : values) {
        const auto u = static_cast<std::uint16_t>(v);
        out.push_back(static_cast<std::uint8_t>(u >> 8));
        out.push_back(static_cast<std::uint8_t>(u & 0xFFu));
    }
    return out;
}

inline std::vector<std::uint8_t> be32(std::initializer_list<std::int32_t> values) {
    std::vector<std::uint8_t> out;
    for (const auto v : values) {
        const auto u = static_cast<std::uint32_t>(v);
        out.push_back(static_cast<std::uint8_t>(u >> 24));
        out.push_back(static_cast<std::uint8_t>((u >> 16) & 0xFFu));
        out.push_back(static_cast<std::uint8_t>((u >> 8) & 0xFFu));
        out.push_back(static_cast<std::uint8_t>(u & 0xFFu));
    }
    return out;
}

// GDSII strings are NUL padded to an even length.
inline std::vector<std::uint8_t> ascii(std::string_view s) {
    std::vector<std::uint8_t> out(s.begin(), s.end());
    if (out.size() % 2 != 0) {
        out.push_back(0);
    }
    return out;
}

inline const std::vector<std::uint8_t> kReal8Milli = {0x3e, 0x41, 0x89, 0x37, 0x4b, 0xc6, 0xa7, 0xf0};
inline const std::vector<std::uint8_t> kReal8Nano = {0x39, 0x44, 0xb8, 0x2f, 0xa0, 0x9b, 0x5a, 0x54};

inline std::vector<std::uint8_t> header_and_endlib() {
    std::vector<std::uint8_t> out;
    append_record(out, 0x00, 0x02, be16({600}));
    append_record(out, 0x04, 0x00);
    return out;
}

// A small but complete library: one structure holding one rectangle.
inline std::vector<std::uint8_t> minimal_library() {
    std::vector<std::uint8_t> out;
    append_record(out, 0x00, 0x02, be16({600}));
    append_record(out, 0x01, 0x02, be16({2026, 10, 18, 12, 0, 0, 2026, 10, 18, 12, 0, 0}));
    append_record(out, 0x02, 0x06, ascii("LIB"));
    std::vector<std::uint8_t> units = kReal8Milli;
    units.insert(units.end(), kReal8Nano.begin(), kReal8Nano.end());
    append_record(out, 0x03, 0x05, units);
    append_record(out, 0x05, 0x02, be16({2026, 10, 18, 12, 0, 0, 2026, 10, 18, 12, 0, 0}));
    append_record(out, 0x06, 0x06, ascii("TOP"));
    append_record(out, 0x08, 0x00);
    append_record(out, 0x0D, 0x02, be16({1}));
    append_record(out, 0x0E, 0x02, be16({0}));
    append_record(out, 0x10, 0x03, be32({0, 0, 1000, 0, 1000, 500, 0, 500, 0, 0}));
    append_record(out, 0x11, 0x00);
    append_record(out, 0x07, 0x00);
    append_record(out, 0x04, 0x00);
    return out;
}

}  // namespace gds::test
