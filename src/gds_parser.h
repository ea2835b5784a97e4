/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include "gds/gds_stream_decoder.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

namespace gds {

struct ParserDecodeOptions {
    bool collect_metadata = true;
    bool debug = false;
    // Invoked once per record, in stream order, as soon as it is decoded.
    stream::RecordCallback on_record;
};

struct DecodeResult {
    nlohmann::ordered_json records = nlohmann::ordered_json::array();
    nlohmann::ordered_json metadata = nlohmann::ordered_json::object();
    stream::DecodedStream stream;
};

class GdsParser {
   public:
    static DecodeResult
    DecodeGdsFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeGdsBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );
};

}  // namespace gds
