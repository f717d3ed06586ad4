#pragma once
/**
 * @file header_codec.hpp
 * @brief Field-level encoding of the summary and entry header blocks.
 *
 * Encoding writes every byte of the block: unused entry bytes become 0x00,
 * reserved bytes become 0xFF, the 12 bytes after the CRC become 0x00.
 * Decoding reads the fields back without validating them; validation is up
 * to the caller (header detector, image inspector).
 */
#include <array>
#include <cstdint>
#include <span>

#include "aiomerge_export.h"
#include "engine/format.hpp"

namespace aiomerge::engine
{

struct SummaryHeader
{
    std::array<uint8_t, 4> magic{kAioMagic};
    uint16_t version{0};
    uint16_t header_size{0};
    uint8_t device_type{0};
    uint32_t fw_version{0};
    uint8_t update_ctrl{0};
    uint8_t entry_count{0};

    bool operator==(const SummaryHeader &) const = default;
};

struct EntryHeader
{
    uint16_t vendor_id{0};
    uint16_t product_id{0};
    uint16_t unique_id{0};
    uint16_t fw_version{0};
    uint32_t data_offset{0};
    uint32_t size{0};
    uint32_t crc32{0};

    bool operator==(const EntryHeader &) const = default;
};

using SummaryBlock = std::span<uint8_t, kSummaryHeaderSize>;
using EntryBlock = std::span<uint8_t, kEntryHeaderSize>;
using ConstSummaryBlock = std::span<const uint8_t, kSummaryHeaderSize>;
using ConstEntryBlock = std::span<const uint8_t, kEntryHeaderSize>;

AIOMERGE_EXPORT void encode_summary_header(const SummaryHeader &header, SummaryBlock out) noexcept;
AIOMERGE_EXPORT void encode_entry_header(const EntryHeader &header, EntryBlock out) noexcept;

[[nodiscard]] AIOMERGE_EXPORT SummaryHeader decode_summary_header(ConstSummaryBlock in) noexcept;
[[nodiscard]] AIOMERGE_EXPORT EntryHeader decode_entry_header(ConstEntryBlock in) noexcept;

/** @brief True if @p bytes starts with the "AIOH" magic. */
[[nodiscard]] AIOMERGE_EXPORT bool has_aio_magic(std::span<const uint8_t> bytes) noexcept;

} // namespace aiomerge::engine
