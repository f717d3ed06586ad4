// header_builder.cpp
#include "engine/header_builder.hpp"
#include "utils/logger.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace aiomerge::engine
{

SummaryHeader make_summary_header(const LayoutPlan &plan, const FormatIdentity &identity)
{
    SummaryHeader h;
    h.magic = kAioMagic;
    h.version = identity.version;
    h.header_size = static_cast<uint16_t>(plan.total_header_size);
    h.device_type = identity.device_type;
    h.fw_version = identity.fw_version;
    h.update_ctrl = identity.update_ctrl;
    h.entry_count = static_cast<uint8_t>(plan.entries.size());
    return h;
}

EntryHeader make_entry_header(const PlacedEntry &entry, uint32_t checksum,
                              const FormatIdentity &identity)
{
    EntryHeader h;
    h.vendor_id = identity.vendor_id;
    h.product_id = identity.product_id;
    h.unique_id = identity.unique_id;
    h.fw_version = identity.entry_fw_version;
    h.data_offset = entry.absolute_offset;
    h.size = entry.size;
    h.crc32 = checksum;
    return h;
}

std::vector<uint8_t> build_header_block(const LayoutPlan &plan, const std::vector<uint32_t> &checksums,
                                        const FormatIdentity &identity)
{
    if (checksums.size() != plan.entries.size())
    {
        throw std::invalid_argument(fmt::format("build_header_block: {} checksums for {} entries",
                                                checksums.size(), plan.entries.size()));
    }
    if (plan.total_header_size != header_size_for(plan.entries.size()))
    {
        throw std::invalid_argument(
            fmt::format("build_header_block: plan header size 0x{:X} does not match {} entries",
                        plan.total_header_size, plan.entries.size()));
    }

    std::vector<uint8_t> block(plan.total_header_size, 0x00);
    encode_summary_header(make_summary_header(plan, identity),
                          SummaryBlock(block.data(), kSummaryHeaderSize));

    for (size_t i = 0; i < plan.entries.size(); ++i)
    {
        uint8_t *slot = block.data() + kSummaryHeaderSize + i * kEntryHeaderSize;
        encode_entry_header(make_entry_header(plan.entries[i], checksums[i], identity),
                            EntryBlock(slot, kEntryHeaderSize));
    }

    LOGGER_DEBUG("built 0x{:X}-byte header block for {} entries", block.size(), plan.entries.size());
    return block;
}

} // namespace aiomerge::engine
