/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace gds::stream {

// Big-endian cursor over a fully loaded GDSII stream. Move-only: a cursor is
// owned by exactly one decoder for the duration of a run.
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    ByteReader(const ByteReader&) = delete;
    ByteReader& operator=(const ByteReader&) = delete;
    ByteReader(ByteReader&&) = default;
    ByteReader& operator=(ByteReader&&) = default;

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    std::uint8_t read_u8() {
        require(1);
        return _data[_pos++];
    }

    std::int16_t read_i16_be() {
        require(2);
        const auto hi = static_cast<std::uint16_t>(_data[_pos]);
        const auto lo = static_cast<std::uint16_t>(_data[_pos + 1]);
        _pos += 2;
        return static_cast<std::int16_t>(static_cast<std::uint16_t>((hi << 8) | lo));
    }

    // Returns a view into the source; valid as long as the source buffer is.
    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        require(count);
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

   private:
    void require(std::size_t count) const {
        if (count > remaining()) {
            throw std::out_of_range(
                std::string("Unexpected EOF at offset ") + std::to_string(_pos) + " reading "
                + std::to_string(count) + " bytes."
            );
        }
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};

}  // namespace gds::stream
