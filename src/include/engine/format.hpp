#pragma once
/**
 * @file format.hpp
 * @brief Fixed layout of the AIO summary header and the ELAN entry header.
 *
 * A packaged image starts with one 0x20-byte summary block followed by one
 * 0x50-byte entry block per merged image. Every multi-byte field is stored
 * little-endian.
 *
 * @code
 *   0x00  magic "AIOH"          0x0D  update_ctrl (u8)
 *   0x04  version (u16)         0x0E  entry_count (u8)
 *   0x06  header_size (u16)     0x0F  reserved, 17 x 0xFF
 *   0x08  device_type (u8)
 *   0x09  fw_version (u32)
 *
 *   entry +0x00 vendor_id (u16)     +0x28 data_offset (u32)
 *         +0x02 unused, 32 x 0x00   +0x2C size (u32)
 *         +0x22 product_id (u16)    +0x30 crc32 (u32) + 12 x 0x00
 *         +0x24 unique_id (u16)     +0x40 reserved, 16 x 0xFF
 *         +0x26 fw_version (u16)
 * @endcode
 */
#include <array>
#include <cstddef>
#include <cstdint>

namespace aiomerge::engine
{

inline constexpr std::array<uint8_t, 4> kAioMagic{'A', 'I', 'O', 'H'};

inline constexpr size_t kSummaryHeaderSize = 0x20;
inline constexpr size_t kEntryHeaderSize = 0x50;

namespace summary_field
{
inline constexpr size_t kMagic = 0x00;
inline constexpr size_t kVersion = 0x04;
inline constexpr size_t kHeaderSize = 0x06;
inline constexpr size_t kDeviceType = 0x08;
inline constexpr size_t kFwVersion = 0x09;
inline constexpr size_t kUpdateCtrl = 0x0D;
inline constexpr size_t kEntryCount = 0x0E;
inline constexpr size_t kReserved = 0x0F;
inline constexpr size_t kReservedLength = 17;
} // namespace summary_field

namespace entry_field
{
inline constexpr size_t kVendorId = 0x00;
inline constexpr size_t kProductId = 0x22;
inline constexpr size_t kUniqueId = 0x24;
inline constexpr size_t kFwVersion = 0x26;
inline constexpr size_t kDataOffset = 0x28;
inline constexpr size_t kSize = 0x2C;
inline constexpr size_t kChecksum = 0x30;
inline constexpr size_t kChecksumLength = 16;
inline constexpr size_t kReserved = 0x40;
inline constexpr size_t kReservedLength = 16;
} // namespace entry_field

/// Largest header the u16 summary field can describe.
inline constexpr uint32_t kMaxHeaderSize = 0xFFFF;
/// Largest entry count the u8 summary field can describe.
inline constexpr uint32_t kMaxEntryCount = 0xFF;

/// Size of the metadata region for @p entry_count entries.
constexpr uint64_t header_size_for(uint64_t entry_count) noexcept
{
    return kSummaryHeaderSize + entry_count * kEntryHeaderSize;
}

/**
 * @struct FormatIdentity
 * @brief Device identity written into every header.
 *
 * These are fixed by the target device; the defaults match the documented
 * values. They can be overridden from a job file's "format" section without
 * changing the layout.
 */
struct FormatIdentity
{
    uint16_t version{0x0001};
    uint8_t device_type{0x01};
    uint32_t fw_version{0x12345678};
    uint8_t update_ctrl{0x00};

    uint16_t vendor_id{0x04F3};
    uint16_t product_id{0x5608}; ///< Stored as bytes 08 56.
    uint16_t unique_id{0xFFFF};
    uint16_t entry_fw_version{0x1234};

    bool operator==(const FormatIdentity &) const = default;
};

} // namespace aiomerge::engine
