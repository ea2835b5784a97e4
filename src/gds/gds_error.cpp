/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_error.h"

namespace gds::stream {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedHeader:
            return "MalformedHeader";
        case ErrorKind::UnsupportedDataType:
            return "UnsupportedDataType";
        case ErrorKind::CorruptRecordLength:
            return "CorruptRecordLength";
        case ErrorKind::TruncatedPayload:
            return "TruncatedPayload";
        case ErrorKind::InvalidEncoding:
            return "InvalidEncoding";
        case ErrorKind::UnknownRecordType:
            return "UnknownRecordType";
        case ErrorKind::MissingTerminator:
            return "MissingTerminator";
    }
    return "Unknown";
}

static std::string format_message(
    ErrorKind kind,
    std::size_t offset,
    std::size_t record_index,
    const std::string& detail
) {
    std::string msg(to_string(kind));
    msg += " at offset ";
    msg += std::to_string(offset);
    msg += ", record #";
    msg += std::to_string(record_index);
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

DecodeError::DecodeError(
    ErrorKind kind,
    std::size_t offset,
    std::size_t record_index,
    const std::string& detail
)
    : std::runtime_error(format_message(kind, offset, record_index, detail)),
      _kind(kind),
      _offset(offset),
      _record_index(record_index),
      _detail(detail) {}

}  // namespace gds::stream
