/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include "gds_stream_decoder.h"

#include <nlohmann/json.hpp>

namespace gds::stream {

nlohmann::ordered_json value_to_json(const DecodedValue& value);

// [name, [values...]]; Ascii records become one string per UTF-8 character.
nlohmann::ordered_json record_to_json(const DecodedRecord& rec);

// [[name, [values...]], ...]
nlohmann::ordered_json stream_to_json(const DecodedStream& stream);

}  // namespace gds::stream
