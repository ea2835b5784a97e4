/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include "gds_byte_reader.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace gds::stream {

inline constexpr std::size_t kRecordHeaderSize = 4;

enum class DataType : std::uint8_t {
    NoData = 0x00,
    BitArray = 0x01,
    Int16 = 0x02,
    Int32 = 0x03,
    Real32 = 0x04,
    Real64 = 0x05,
    Ascii = 0x06,
};

std::optional<DataType> to_data_type(std::uint8_t tag);
std::size_t element_width(DataType type);
std::string_view data_type_name(DataType type);

// One framed record. The payload is a view into the source buffer and is only
// valid while that buffer is alive.
struct Record {
    std::size_t offset = 0;
    std::int16_t length = 0;
    std::uint8_t record_type = 0;
    DataType data_type = DataType::NoData;
    std::span<const std::uint8_t> payload;

    std::size_t width() const { return element_width(data_type); }
    std::size_t element_count() const;
    std::span<const std::uint8_t> element(std::size_t index) const;
};

// Reads exactly one record and advances the reader by its declared length.
// Throws DecodeError; the reader position is unspecified after a failure.
Record read_record(ByteReader& reader, std::size_t record_index = 0);

}  // namespace gds::stream
