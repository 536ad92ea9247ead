#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pngshot::byte_order_internal {

constexpr uint8_t
u8(std::byte b) noexcept
{
    return static_cast<uint8_t>(b);
}


inline bool
read_u16be(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (offset + 2 > bytes.size()) {
        return false;
    }
    *out = static_cast<uint16_t>(u8(bytes[offset + 0]) << 8)
           | static_cast<uint16_t>(u8(bytes[offset + 1]) << 0);
    return true;
}


inline bool
read_u16le(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (offset + 2 > bytes.size()) {
        return false;
    }
    *out = static_cast<uint16_t>(u8(bytes[offset + 0]) << 0)
           | static_cast<uint16_t>(u8(bytes[offset + 1]) << 8);
    return true;
}


inline bool
read_u32be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (offset + 4 > bytes.size()) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
    return true;
}


inline bool
read_u32le(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (offset + 4 > bytes.size()) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16)
           | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 24);
    return true;
}


inline void
append_u32be(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}

}  // namespace pngshot::byte_order_internal
