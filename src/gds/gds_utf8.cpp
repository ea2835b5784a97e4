/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_utf8.h"

namespace gds::stream::utf8 {

static bool is_continuation(std::uint8_t b) {
    return (b & 0xC0u) == 0x80u;
}

std::size_t sequence_length(std::span<const std::uint8_t> bytes, std::size_t pos) {
    if (pos >= bytes.size()) {
        return 0;
    }
    const std::uint8_t b0 = bytes[pos];
    std::size_t len = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (b0 < 0x80) {
        return 1;
    } else if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) {
            lo = 0xA0;
        } else if (b0 == 0xED) {
            hi = 0x9F;
        }
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) {
            lo = 0x90;
        } else if (b0 == 0xF4) {
            hi = 0x8F;
        }
    } else {
        return 0;
    }

    if (pos + len > bytes.size()) {
        return 0;
    }
    const std::uint8_t b1 = bytes[pos + 1];
    if (b1 < lo || b1 > hi) {
        return 0;
    }
    for (std::size_t i = 2; i < len; i++) {
        if (!is_continuation(bytes[pos + i])) {
            return 0;
        }
    }
    return len;
}

std::optional<std::size_t> find_invalid(std::span<const std::uint8_t> bytes) {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const std::size_t len = sequence_length(bytes, pos);
        if (len == 0) {
            return pos;
        }
        pos += len;
    }
    return std::nullopt;
}

std::vector<std::string> split_code_points(std::string_view text) {
    const auto bytes = std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()
    );
    std::vector<std::string> out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        std::size_t len = sequence_length(bytes, pos);
        if (len == 0) {
            len = 1;
        }
        out.emplace_back(text.substr(pos, len));
        pos += len;
    }
    return out;
}

}  // namespace gds::stream::utf8
