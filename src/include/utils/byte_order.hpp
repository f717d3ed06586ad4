#pragma once
/**
 * @file byte_order.hpp
 * @brief Little-endian field access for the on-disk header structures.
 *
 * The AIO/ELAN header format stores every multi-byte integer little-endian.
 * Structures are never written by copying struct memory (padding and host
 * byte order differ between builds); each field is stored at its fixed
 * offset through these helpers.
 *
 * @example
 *   std::array<uint8_t, 0x20> block{};
 *   store_le_u16(block.data(), 0x06, header_size);
 *   uint16_t back = load_le_u16(block.data(), 0x06);
 */
#include <cstddef>
#include <cstdint>

namespace aiomerge::utils
{

/** Store a uint16_t at buf + offset in little-endian order. */
inline void store_le_u16(uint8_t *buf, size_t offset, uint16_t v) noexcept
{
    buf[offset] = static_cast<uint8_t>(v);
    buf[offset + 1] = static_cast<uint8_t>(v >> 8);
}

/** Store a uint32_t at buf + offset in little-endian order. */
inline void store_le_u32(uint8_t *buf, size_t offset, uint32_t v) noexcept
{
    buf[offset] = static_cast<uint8_t>(v);
    buf[offset + 1] = static_cast<uint8_t>(v >> 8);
    buf[offset + 2] = static_cast<uint8_t>(v >> 16);
    buf[offset + 3] = static_cast<uint8_t>(v >> 24);
}

/** Load a little-endian uint16_t from buf + offset. */
inline uint16_t load_le_u16(const uint8_t *buf, size_t offset) noexcept
{
    return static_cast<uint16_t>(buf[offset] | (static_cast<uint16_t>(buf[offset + 1]) << 8));
}

/** Load a little-endian uint32_t from buf + offset. */
inline uint32_t load_le_u32(const uint8_t *buf, size_t offset) noexcept
{
    return static_cast<uint32_t>(buf[offset]) | (static_cast<uint32_t>(buf[offset + 1]) << 8) |
           (static_cast<uint32_t>(buf[offset + 2]) << 16) |
           (static_cast<uint32_t>(buf[offset + 3]) << 24);
}

/** Fill [offset, offset + count) with a single byte value. */
inline void fill_bytes(uint8_t *buf, size_t offset, size_t count, uint8_t v) noexcept
{
    for (size_t i = 0; i < count; ++i)
        buf[offset + i] = v;
}

} // namespace aiomerge::utils
