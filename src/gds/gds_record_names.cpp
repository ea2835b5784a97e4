/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_record_names.h"

namespace gds::stream {

std::optional<RecordType> to_record_type(std::uint8_t tag) {
    switch (tag) {
        case 0x00:
            return RecordType::Header;
        case 0x01:
            return RecordType::BgnLib;
        case 0x02:
            return RecordType::LibName;
        case 0x03:
            return RecordType::Units;
        case 0x04:
            return RecordType::EndLib;
        case 0x05:
            return RecordType::BgnStr;
        case 0x06:
            return RecordType::StrName;
        case 0x07:
            return RecordType::EndStr;
        case 0x08:
            return RecordType::Boundary;
        case 0x09:
            return RecordType::Path;
        case 0x0A:
            return RecordType::SRef;
        case 0x0B:
            return RecordType::ARef;
        case 0x0C:
            return RecordType::Text;
        case 0x0D:
            return RecordType::Layer;
        case 0x0E:
            return RecordType::DataTypeRec;
        case 0x0F:
            return RecordType::Width;
        case 0x10:
            return RecordType::XY;
        case 0x11:
            return RecordType::EndEl;
        case 0x12:
            return RecordType::SName;
        case 0x13:
            return RecordType::ColRow;
        case 0x15:
            return RecordType::Node;
        case 0x16:
            return RecordType::TextType;
        case 0x17:
            return RecordType::Presentation;
        case 0x19:
            return RecordType::String;
        case 0x1A:
            return RecordType::STrans;
        case 0x1B:
            return RecordType::Mag;
        case 0x1C:
            return RecordType::Angle;
        case 0x1F:
            return RecordType::RefLibs;
        case 0x20:
            return RecordType::Fonts;
        case 0x21:
            return RecordType::PathType;
        case 0x22:
            return RecordType::Generations;
        case 0x23:
            return RecordType::AttrTable;
        case 0x26:
            return RecordType::ElFlags;
        case 0x2A:
            return RecordType::NodeType;
        case 0x2B:
            return RecordType::PropAttr;
        case 0x2C:
            return RecordType::PropValue;
        case 0x2D:
            return RecordType::Box;
        case 0x2E:
            return RecordType::BoxType;
        case 0x2F:
            return RecordType::Plex;
        case 0x32:
            return RecordType::TapeNum;
        case 0x33:
            return RecordType::TapeCode;
        case 0x36:
            return RecordType::Format;
        case 0x37:
            return RecordType::Mask;
        case 0x38:
            return RecordType::EndMasks;
        default:
            return std::nullopt;
    }
}

std::string_view record_type_name(RecordType type) {
    switch (type) {
        case RecordType::Header:
            return "HEADER";
        case RecordType::BgnLib:
            return "BGNLIB";
        case RecordType::LibName:
            return "LIBNAME";
        case RecordType::Units:
            return "UNITS";
        case RecordType::EndLib:
            return "ENDLIB";
        case RecordType::BgnStr:
            return "BGNSTR";
        case RecordType::StrName:
            return "STRNAME";
        case RecordType::EndStr:
            return "ENDSTR";
        case RecordType::Boundary:
            return "BOUNDARY";
        case RecordType::Path:
            return "PATH";
        case RecordType::SRef:
            return "SREF";
        case RecordType::ARef:
            return "AREF";
        case RecordType::Text:
            return "TEXT";
        case RecordType::Layer:
            return "LAYER";
        case RecordType::DataTypeRec:
            return "DATATYPE";
        case RecordType::Width:
            return "WIDTH";
        case RecordType::XY:
            return "XY";
        case RecordType::EndEl:
            return "ENDEL";
        case RecordType::SName:
            return "SNAME";
        case RecordType::ColRow:
            return "COLROW";
        case RecordType::Node:
            return "NODE";
        case RecordType::TextType:
            return "TEXTTYPE";
        case RecordType::Presentation:
            return "PRESENTATION";
        case RecordType::String:
            return "STRING";
        case RecordType::STrans:
            return "STRANS";
        case RecordType::Mag:
            return "MAG";
        case RecordType::Angle:
            return "ANGLE";
        case RecordType::RefLibs:
            return "REFLIBS";
        case RecordType::Fonts:
            return "FONTS";
        case RecordType::PathType:
            return "PATHTYPE";
        case RecordType::Generations:
            return "GENERATIONS";
        case RecordType::AttrTable:
            return "ATTRTABLE";
        case RecordType::ElFlags:
            return "ELFLAGS";
        case RecordType::NodeType:
            return "NODETYPE";
        case RecordType::PropAttr:
            return "PROPATTR";
        case RecordType::PropValue:
            return "PROPVALUE";
        case RecordType::Box:
            return "BOX";
        case RecordType::BoxType:
            return "BOXTYPE";
        case RecordType::Plex:
            return "PLEX";
        case RecordType::TapeNum:
            return "TAPENUM";
        case RecordType::TapeCode:
            return "TAPECODE";
        case RecordType::Format:
            return "FORMAT";
        case RecordType::Mask:
            return "MASK";
        case RecordType::EndMasks:
            return "ENDMASKS";
    }
    return {};
}

const RecordNameTable& RecordNameTable::standard() {
    static const RecordNameTable table;
    return table;
}

RecordNameTable::RecordNameTable() {
    for (int tag = 0; tag < 256; tag++) {
        if (const auto type = to_record_type(static_cast<std::uint8_t>(tag)); type.has_value()) {
            _names[static_cast<std::size_t>(tag)] = record_type_name(*type);
        }
    }
}

std::optional<std::string_view> RecordNameTable::lookup(std::uint8_t tag) const {
    const std::string_view name = _names[tag];
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::size_t RecordNameTable::size() const {
    std::size_t n = 0;
    for (const auto& name : _names) {
        if (!name.empty()) {
            n++;
        }
    }
    return n;
}

}  // namespace gds::stream
