// header_codec.cpp
#include "engine/header_codec.hpp"
#include "utils/byte_order.hpp"

#include <algorithm>

namespace aiomerge::engine
{

using utils::fill_bytes;
using utils::load_le_u16;
using utils::load_le_u32;
using utils::store_le_u16;
using utils::store_le_u32;

void encode_summary_header(const SummaryHeader &header, SummaryBlock out) noexcept
{
    uint8_t *p = out.data();
    std::copy(header.magic.begin(), header.magic.end(), p + summary_field::kMagic);
    store_le_u16(p, summary_field::kVersion, header.version);
    store_le_u16(p, summary_field::kHeaderSize, header.header_size);
    p[summary_field::kDeviceType] = header.device_type;
    store_le_u32(p, summary_field::kFwVersion, header.fw_version);
    p[summary_field::kUpdateCtrl] = header.update_ctrl;
    p[summary_field::kEntryCount] = header.entry_count;
    fill_bytes(p, summary_field::kReserved, summary_field::kReservedLength, 0xFF);
}

void encode_entry_header(const EntryHeader &header, EntryBlock out) noexcept
{
    uint8_t *p = out.data();
    fill_bytes(p, 0, kEntryHeaderSize, 0x00);
    store_le_u16(p, entry_field::kVendorId, header.vendor_id);
    store_le_u16(p, entry_field::kProductId, header.product_id);
    store_le_u16(p, entry_field::kUniqueId, header.unique_id);
    store_le_u16(p, entry_field::kFwVersion, header.fw_version);
    store_le_u32(p, entry_field::kDataOffset, header.data_offset);
    store_le_u32(p, entry_field::kSize, header.size);
    store_le_u32(p, entry_field::kChecksum, header.crc32);
    fill_bytes(p, entry_field::kReserved, entry_field::kReservedLength, 0xFF);
}

SummaryHeader decode_summary_header(ConstSummaryBlock in) noexcept
{
    const uint8_t *p = in.data();
    SummaryHeader h;
    std::copy(p + summary_field::kMagic, p + summary_field::kMagic + 4, h.magic.begin());
    h.version = load_le_u16(p, summary_field::kVersion);
    h.header_size = load_le_u16(p, summary_field::kHeaderSize);
    h.device_type = p[summary_field::kDeviceType];
    h.fw_version = load_le_u32(p, summary_field::kFwVersion);
    h.update_ctrl = p[summary_field::kUpdateCtrl];
    h.entry_count = p[summary_field::kEntryCount];
    return h;
}

EntryHeader decode_entry_header(ConstEntryBlock in) noexcept
{
    const uint8_t *p = in.data();
    EntryHeader h;
    h.vendor_id = load_le_u16(p, entry_field::kVendorId);
    h.product_id = load_le_u16(p, entry_field::kProductId);
    h.unique_id = load_le_u16(p, entry_field::kUniqueId);
    h.fw_version = load_le_u16(p, entry_field::kFwVersion);
    h.data_offset = load_le_u32(p, entry_field::kDataOffset);
    h.size = load_le_u32(p, entry_field::kSize);
    h.crc32 = load_le_u32(p, entry_field::kChecksum);
    return h;
}

bool has_aio_magic(std::span<const uint8_t> bytes) noexcept
{
    return bytes.size() >= kAioMagic.size() &&
           std::equal(kAioMagic.begin(), kAioMagic.end(), bytes.begin());
}

} // namespace aiomerge::engine
