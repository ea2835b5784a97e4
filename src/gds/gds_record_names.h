/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gds::stream {

enum class RecordType : std::uint8_t {
    Header = 0x00,
    BgnLib = 0x01,
    LibName = 0x02,
    Units = 0x03,
    EndLib = 0x04,
    BgnStr = 0x05,
    StrName = 0x06,
    EndStr = 0x07,
    Boundary = 0x08,
    Path = 0x09,
    SRef = 0x0A,
    ARef = 0x0B,
    Text = 0x0C,
    Layer = 0x0D,
    DataTypeRec = 0x0E,
    Width = 0x0F,
    XY = 0x10,
    EndEl = 0x11,
    SName = 0x12,
    ColRow = 0x13,
    Node = 0x15,
    TextType = 0x16,
    Presentation = 0x17,
    String = 0x19,
    STrans = 0x1A,
    Mag = 0x1B,
    Angle = 0x1C,
    RefLibs = 0x1F,
    Fonts = 0x20,
    PathType = 0x21,
    Generations = 0x22,
    AttrTable = 0x23,
    ElFlags = 0x26,
    NodeType = 0x2A,
    PropAttr = 0x2B,
    PropValue = 0x2C,
    Box = 0x2D,
    BoxType = 0x2E,
    Plex = 0x2F,
    TapeNum = 0x32,
    TapeCode = 0x33,
    Format = 0x36,
    Mask = 0x37,
    EndMasks = 0x38,
};

inline constexpr std::uint8_t kTerminatorRecordType = static_cast<std::uint8_t>(RecordType::EndLib);

std::optional<RecordType> to_record_type(std::uint8_t tag);
std::string_view record_type_name(RecordType type);

// Immutable tag -> name mapping handed to the stream decoder. standard()
// covers every RecordType; lookups outside it return nullopt.
class RecordNameTable {
   public:
    static const RecordNameTable& standard();

    std::optional<std::string_view> lookup(std::uint8_t tag) const;
    std::size_t size() const;

   private:
    RecordNameTable();

    std::array<std::string_view, 256> _names{};
};

}  // namespace gds::stream
