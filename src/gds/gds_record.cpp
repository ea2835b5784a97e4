/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_record.h"
#include "gds/gds_error.h"

#include <stdexcept>
#include <string>

namespace gds::stream {

std::optional<DataType> to_data_type(std::uint8_t tag) {
    switch (tag) {
        case 0x00:
            return DataType::NoData;
        case 0x01:
            return DataType::BitArray;
        case 0x02:
            return DataType::Int16;
        case 0x03:
            return DataType::Int32;
        case 0x04:
            return DataType::Real32;
        case 0x05:
            return DataType::Real64;
        case 0x06:
            return DataType::Ascii;
        default:
            return std::nullopt;
    }
}

std::size_t element_width(DataType type) {
    switch (type) {
        case DataType::NoData:
            return 0;
        case DataType::BitArray:
            return 1;
        case DataType::Int16:
            return 2;
        case DataType::Int32:
            return 4;
        case DataType::Real32:
            return 4;
        case DataType::Real64:
            return 8;
        case DataType::Ascii:
            return 1;
    }
    return 0;
}

std::string_view data_type_name(DataType type) {
    switch (type) {
        case DataType::NoData:
            return "NoData";
        case DataType::BitArray:
            return "BitArray";
        case DataType::Int16:
            return "Int16";
        case DataType::Int32:
            return "Int32";
        case DataType::Real32:
            return "Real32";
        case DataType::Real64:
            return "Real64";
        case DataType::Ascii:
            return "Ascii";
    }
    return "Unknown";
}

std::size_t Record::element_count() const {
    const std::size_t w = width();
    return w == 0 ? 0 : payload.size() / w;
}

std::span<const std::uint8_t> Record::element(std::size_t index) const {
    const std::size_t w = width();
    if (w == 0 || index >= element_count()) {
        throw std::out_of_range("Record element index out of range");
    }
    return payload.subspan(index * w, w);
}

static std::string hex_byte(std::uint8_t v) {
    static const char hexdig[] = "0123456789ABCDEF";
    std::string out = "0x";
    out.push_back(hexdig[(v >> 4) & 0xF]);
    out.push_back(hexdig[v & 0xF]);
    return out;
}

Record read_record(ByteReader& reader, std::size_t record_index) {
    const std::size_t start = reader.position();
    if (reader.remaining() < kRecordHeaderSize) {
        throw DecodeError(
            ErrorKind::MalformedHeader, start, record_index,
            std::to_string(reader.remaining()) + " bytes left, header needs 4"
        );
    }

    Record rec{};
    rec.offset = start;
    rec.length = reader.read_i16_be();
    rec.record_type = reader.read_u8();
    const std::uint8_t data_tag = reader.read_u8();

    const auto data_type = to_data_type(data_tag);
    if (!data_type.has_value()) {
        throw DecodeError(
            ErrorKind::UnsupportedDataType, start, record_index,
            "data type " + hex_byte(data_tag) + " in record type " + hex_byte(rec.record_type)
        );
    }
    rec.data_type = *data_type;

    if (rec.length < static_cast<std::int16_t>(kRecordHeaderSize)) {
        throw DecodeError(
            ErrorKind::CorruptRecordLength, start, record_index,
            "declared length " + std::to_string(rec.length) + " is shorter than the header"
        );
    }

    const std::size_t payload_len = static_cast<std::size_t>(rec.length) - kRecordHeaderSize;
    const std::size_t width = element_width(rec.data_type);
    const bool misaligned = width == 0 ? payload_len != 0 : (payload_len % width) != 0;
    if (misaligned) {
        throw DecodeError(
            ErrorKind::CorruptRecordLength, start, record_index,
            "payload of " + std::to_string(payload_len) + " bytes is not a multiple of "
                + std::to_string(width) + " for " + std::string(data_type_name(rec.data_type))
        );
    }

    if (reader.remaining() < payload_len) {
        throw DecodeError(
            ErrorKind::TruncatedPayload, start, record_index,
            "payload needs " + std::to_string(payload_len) + " bytes, "
                + std::to_string(reader.remaining()) + " left"
        );
    }
    rec.payload = reader.read_bytes(payload_len);
    return rec;
}

}  // namespace gds::stream
