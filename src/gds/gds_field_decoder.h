/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include "gds_record.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace gds::stream {

// none, int16, int32, float32, float64, character
using DecodedValue = std::variant<std::monostate, std::int16_t, std::int32_t, float, double, char>;

// Interprets the payload according to rec.data_type. BitArray payloads are not
// decoded and yield no values. Ascii payloads must be well-formed UTF-8 as a
// whole; each byte becomes one char code unit.
std::vector<DecodedValue> decode_fields(const Record& rec, std::size_t record_index = 0);

// Concatenates the char values of an Ascii record.
std::string values_to_text(const std::vector<DecodedValue>& values);

}  // namespace gds::stream
