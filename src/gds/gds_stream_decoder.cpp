/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_stream_decoder.h"
#include "gds/gds_error.h"
#include "utils/log.h"

#include <stdexcept>

namespace gds::stream {

StreamDecoder::StreamDecoder(std::span<const std::uint8_t> source, const RecordNameTable& names)
    : _reader(source), _names(names) {}

DecodedRecord StreamDecoder::decode_next() {
    const std::size_t index = _records.size();
    if (_reader.at_end()) {
        throw DecodeError(
            ErrorKind::MissingTerminator, _reader.position(), index,
            "end of stream reached without an ENDLIB record"
        );
    }

    const Record rec = read_record(_reader, index);
    auto values = decode_fields(rec, index);

    const auto name = _names.lookup(rec.record_type);
    if (!name.has_value()) {
        throw DecodeError(
            ErrorKind::UnknownRecordType, rec.offset, index,
            "record type " + std::to_string(static_cast<unsigned>(rec.record_type))
                + " has no name"
        );
    }

    GDS_LOG_DEBUG(
        "record #%zu @%zu: %.*s len=%d data=%.*s values=%zu", index, rec.offset,
        static_cast<int>(name->size()), name->data(), static_cast<int>(rec.length),
        static_cast<int>(data_type_name(rec.data_type).size()), data_type_name(rec.data_type).data(),
        values.size()
    );

    DecodedRecord out{};
    out.name = std::string(*name);
    out.record_type = rec.record_type;
    out.data_type = rec.data_type;
    out.offset = rec.offset;
    out.length = rec.length;
    out.values = std::move(values);
    return out;
}

DecodedStream StreamDecoder::run(const RecordCallback& on_record) {
    if (_state != DecoderState::Reading) {
        throw std::logic_error("StreamDecoder::run called on a finished decoder");
    }

    try {
        while (_state == DecoderState::Reading) {
            DecodedRecord rec = decode_next();
            const bool terminator = rec.record_type == kTerminatorRecordType;
            _records.push_back(std::move(rec));
            if (on_record) {
                on_record(_records.back());
            }
            if (terminator) {
                _state = DecoderState::Done;
            }
        }
    } catch (...) {
        _state = DecoderState::Error;
        throw;
    }

    DecodedStream out{};
    out.bytes_consumed = _reader.position();
    out.trailing_bytes = _reader.remaining();
    out.records = std::move(_records);
    _records.clear();
    if (out.trailing_bytes > 0) {
        GDS_LOG_DEBUG("%zu trailing bytes after ENDLIB ignored", out.trailing_bytes);
    }
    return out;
}

DecodedStream decode_stream(
    std::span<const std::uint8_t> source,
    const RecordNameTable& names,
    const RecordCallback& on_record
) {
    StreamDecoder decoder(source, names);
    return decoder.run(on_record);
}

}  // namespace gds::stream
