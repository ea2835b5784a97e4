/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gds::stream {

enum class ErrorKind {
    MalformedHeader,
    UnsupportedDataType,
    CorruptRecordLength,
    TruncatedPayload,
    InvalidEncoding,
    UnknownRecordType,
    MissingTerminator,
};

std::string_view to_string(ErrorKind kind);

// Every decode failure is fatal to the run; offset is the absolute byte offset
// in the source, record_index the zero-based index of the failing record.
class DecodeError : public std::runtime_error {
   public:
    DecodeError(ErrorKind kind, std::size_t offset, std::size_t record_index, const std::string& detail);

    ErrorKind kind() const { return _kind; }
    std::size_t offset() const { return _offset; }
    std::size_t record_index() const { return _record_index; }
    const std::string& detail() const { return _detail; }

   private:
    ErrorKind _kind;
    std::size_t _offset;
    std::size_t _record_index;
    std::string _detail;
};

}  // namespace gds::stream
