/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_json.h"
#include "gds/gds_utf8.h"
#include "utils/log.h"

#include <cmath>
#include <string>
#include <type_traits>

namespace gds::stream {

nlohmann::ordered_json value_to_json(const DecodedValue& value) {
    return std::visit(
        [](const auto& v) -> nlohmann::ordered_json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, char>) {
                return std::string(1, v);
            } else if constexpr (std::is_same_v<T, float>) {
                return static_cast<double>(v);
            } else {
                return v;
            }
        },
        value
    );
}

static bool is_non_finite(const DecodedValue& value) {
    if (const auto* f = std::get_if<float>(&value)) {
        return !std::isfinite(*f);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return !std::isfinite(*d);
    }
    return false;
}

nlohmann::ordered_json record_to_json(const DecodedRecord& rec) {
    nlohmann::ordered_json values = nlohmann::ordered_json::array();
    if (rec.data_type == DataType::Ascii) {
        for (auto& ch : utf8::split_code_points(values_to_text(rec.values))) {
            values.push_back(std::move(ch));
        }
    } else {
        for (std::size_t i = 0; i < rec.values.size(); i++) {
            // JSON has no NaN/Inf; nlohmann writes them as null.
            if (is_non_finite(rec.values[i])) {
                GDS_LOG_DEBUG(
                    "%s @%zu: value #%zu is not finite, written as null", rec.name.c_str(),
                    rec.offset, i
                );
            }
            values.push_back(value_to_json(rec.values[i]));
        }
    }
    nlohmann::ordered_json pair = nlohmann::ordered_json::array();
    pair.push_back(rec.name);
    pair.push_back(std::move(values));
    return pair;
}

nlohmann::ordered_json stream_to_json(const DecodedStream& stream) {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& rec : stream.records) {
        out.push_back(record_to_json(rec));
    }
    return out;
}

}  // namespace gds::stream
