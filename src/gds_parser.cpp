/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds_parser.h"

#include "gds/gds_json.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <blake3.h>

#include <array>
#include <chrono>
#include <map>
#include <string>
#include <utility>

namespace gds {

static std::string to_hex_bytes(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

static std::array<std::uint8_t, BLAKE3_OUT_LEN> blake3_hash32(std::span<const std::uint8_t> bytes) {
    std::array<std::uint8_t, BLAKE3_OUT_LEN> out{};
    blake3_hasher h{};
    blake3_hasher_init(&h);
    if (!bytes.empty()) {
        blake3_hasher_update(&h, bytes.data(), bytes.size());
    }
    blake3_hasher_finalize(&h, out.data(), out.size());
    return out;
}

static nlohmann::ordered_json build_metadata_block(
    std::span<const std::uint8_t> bytes,
    const stream::DecodedStream& decoded,
    std::string_view label
) {
    nlohmann::ordered_json meta = nlohmann::ordered_json::object();
    if (!label.empty()) {
        meta["source"] = std::string(label);
    }
    meta["sourceSize"] = bytes.size();
    meta["sourceBlake3"] = to_hex_bytes(blake3_hash32(bytes));
    meta["recordCount"] = decoded.records.size();
    meta["bytesConsumed"] = decoded.bytes_consumed;
    meta["trailingBytes"] = decoded.trailing_bytes;

    // Keyed by tag so the counts come out in stream-format order; the names are
    // the ones the decoder resolved.
    std::map<std::uint8_t, std::pair<std::string, std::size_t>> counts;
    for (const auto& rec : decoded.records) {
        auto& entry = counts[rec.record_type];
        entry.first = rec.name;
        entry.second++;
    }
    nlohmann::ordered_json type_counts = nlohmann::ordered_json::object();
    for (const auto& [tag, entry] : counts) {
        type_counts[entry.first] = entry.second;
    }
    meta["recordTypeCounts"] = std::move(type_counts);
    return meta;
}

DecodeResult GdsParser::DecodeGdsFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    // An empty file goes through the decoder too and fails as MissingTerminator.
    const auto bytes = fs_utils::read_file(path);
    return DecodeGdsBytes(bytes, opt, path.filename().string());
}

DecodeResult GdsParser::DecodeGdsBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    stream::DecodedStream decoded =
        stream::decode_stream(bytes, stream::RecordNameTable::standard(), opt.on_record);
    const auto t1 = std::chrono::steady_clock::now();

    DecodeResult result{};
    result.records = stream::stream_to_json(decoded);
    if (opt.collect_metadata) {
        result.metadata = build_metadata_block(bytes, decoded, label);
    }
    const auto t2 = std::chrono::steady_clock::now();

    if (opt.debug) {
        const auto decode_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        const auto json_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
        GDS_LOG_INFO(
            "Decoded %.*s: bytes=%zu records=%zu decode=%lldms json=%lldms",
            static_cast<int>(label.size()), label.data(), bytes.size(), decoded.records.size(),
            static_cast<long long>(decode_ms), static_cast<long long>(json_ms)
        );
    }
    result.stream = std::move(decoded);
    return result;
}

}  // namespace gds
