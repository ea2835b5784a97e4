/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include "gds_byte_reader.h"
#include "gds_field_decoder.h"
#include "gds_record.h"
#include "gds_record_names.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace gds::stream {

struct DecodedRecord {
    std::string name;
    std::uint8_t record_type = 0;
    DataType data_type = DataType::NoData;
    std::size_t offset = 0;
    std::int16_t length = 0;
    std::vector<DecodedValue> values;
};

struct DecodedStream {
    std::vector<DecodedRecord> records;
    std::size_t bytes_consumed = 0;
    // Bytes after the terminator record (tape block padding), never decoded.
    std::size_t trailing_bytes = 0;
};

enum class DecoderState { Reading, Done, Error };

using RecordCallback = std::function<void(const DecodedRecord&)>;

// Decodes records in order until the ENDLIB terminator. A StreamDecoder owns
// its cursor and runs once; any failure leaves it in DecoderState::Error with
// the records decoded so far still available through records().
class StreamDecoder {
   public:
    StreamDecoder(std::span<const std::uint8_t> source, const RecordNameTable& names);

    DecodedStream run(const RecordCallback& on_record = {});

    DecoderState state() const { return _state; }
    const std::vector<DecodedRecord>& records() const { return _records; }
    std::size_t position() const { return _reader.position(); }

   private:
    DecodedRecord decode_next();

    ByteReader _reader;
    const RecordNameTable& _names;
    DecoderState _state = DecoderState::Reading;
    std::vector<DecodedRecord> _records;
};

DecodedStream decode_stream(
    std::span<const std::uint8_t> source,
    const RecordNameTable& names = RecordNameTable::standard(),
    const RecordCallback& on_record = {}
);

}  // namespace gds::stream
