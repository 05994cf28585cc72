#pragma once

#include <cstdint>
#include <vector>

namespace rcon {
namespace internal {

// Little-endian conversion utilities
// The RCON wire format is little-endian on every platform, so conversion is
// done byte by byte rather than through host byte-order macros

inline uint32_t ReadUInt32LE(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

inline int32_t ReadInt32LE(const uint8_t* data) {
    return static_cast<int32_t>(ReadUInt32LE(data));
}

inline void WriteUInt32LE(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

inline void WriteInt32LE(std::vector<uint8_t>& buffer, int32_t value) {
    WriteUInt32LE(buffer, static_cast<uint32_t>(value));
}

} // namespace internal
} // namespace rcon
