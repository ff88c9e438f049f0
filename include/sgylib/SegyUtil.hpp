#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace segy {
    constexpr int TextHeaderSize = 3200;
    constexpr int BinHeaderSize = 400;
    constexpr int TraceHeaderSize = 240;
    constexpr int TextLineWidth = 80;
    constexpr int TextLineCount = 40;

    constexpr int FormatInt16 = 3;
    constexpr int Revision1 = 0x0100;

    // EBCDIC code for '?', used for characters CP500 cannot represent
    constexpr uint8_t EbcdicReplacement = 0x6F;
    constexpr uint8_t EbcdicSpace = 0x40;
}

// Offset is 0-based from the start of the header block
struct FieldInfo {
    int offset;
    int size;
};

inline void set_i16_be(uint8_t* buf, int offset, int16_t value) {
    uint16_t v = static_cast<uint16_t>(value);
    buf[offset + 0] = static_cast<uint8_t>((v >> 8) & 0xFF);
    buf[offset + 1] = static_cast<uint8_t>(v & 0xFF);
}

inline void set_i32_be(uint8_t* buf, int offset, int32_t value) {
    uint32_t v = static_cast<uint32_t>(value);
    buf[offset + 0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    buf[offset + 1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    buf[offset + 2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    buf[offset + 3] = static_cast<uint8_t>(v & 0xFF);
}

inline int16_t get_i16_be(const uint8_t* buf, int offset) {
    return static_cast<int16_t>((static_cast<uint16_t>(buf[offset]) << 8) |
                                static_cast<uint16_t>(buf[offset + 1]));
}

inline uint32_t get_u32_be(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24) |
           (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8) |
           static_cast<uint32_t>(buf[3]);
}

inline int32_t get_i32_be(const uint8_t* buf, int offset) {
    return static_cast<int32_t>(get_u32_be(buf + offset));
}

int32_t get_field_value(const uint8_t* header, const FieldInfo& info);
void set_field_value(uint8_t* header, const FieldInfo& info, int32_t value);

// UTF-8 -> EBCDIC (CP500). Code points outside Latin-1 and malformed bytes
// become segy::EbcdicReplacement; their number is added to *replaced.
std::vector<uint8_t> utf8_to_ebcdic(const std::string& text, std::size_t* replaced = nullptr);

// EBCDIC (CP500) -> UTF-8. Lossless for every byte value.
std::string ebcdic_to_utf8(const uint8_t* data, std::size_t size);
