/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gds::stream::utf8 {

// Length of the well-formed sequence starting at bytes[pos], or 0 if the
// bytes there are not a valid UTF-8 sequence (overlong forms, surrogates and
// code points above U+10FFFF included).
std::size_t sequence_length(std::span<const std::uint8_t> bytes, std::size_t pos);

// Index of the first byte that does not start a well-formed sequence.
std::optional<std::size_t> find_invalid(std::span<const std::uint8_t> bytes);

// Splits already validated text into one string per code point.
std::vector<std::string> split_code_points(std::string_view text);

}  // namespace gds::stream::utf8
