// image_inspector.cpp
#include "engine/image_inspector.hpp"
#include "engine/crc32.hpp"
#include "utils/logger.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace aiomerge::engine
{

bool InspectedImage::all_verified() const noexcept
{
    return std::all_of(entries.begin(), entries.end(),
                       [](const InspectedEntry &e) { return e.in_bounds && e.checksum_ok; });
}

MergeResult<InspectedImage> inspect_image(std::span<const uint8_t> image)
{
    using R = MergeResult<InspectedImage>;

    if (!has_aio_magic(image))
    {
        return R::error(MergeFailure{MergeError::NotPackaged, "no AIO header magic at offset 0",
                                     std::nullopt, std::nullopt, std::nullopt});
    }
    if (image.size() < kSummaryHeaderSize)
    {
        return R::error(MergeFailure{
            MergeError::MalformedHeader,
            fmt::format("file is {} bytes, shorter than the 0x{:X}-byte summary header", image.size(),
                        kSummaryHeaderSize),
            std::nullopt, std::nullopt, std::nullopt});
    }

    InspectedImage result;
    result.file_size = image.size();
    result.summary = decode_summary_header(image.first<kSummaryHeaderSize>());

    const uint64_t needed = header_size_for(result.summary.entry_count);
    if (result.summary.header_size < needed || result.summary.header_size > image.size())
    {
        return R::error(MergeFailure{
            MergeError::MalformedHeader,
            fmt::format("header size 0x{:X} is inconsistent with {} entries (need 0x{:X}) "
                        "in a {}-byte file",
                        result.summary.header_size, result.summary.entry_count, needed, image.size()),
            std::nullopt, std::nullopt, result.summary.header_size});
    }

    for (size_t i = 0; i < result.summary.entry_count; ++i)
    {
        const size_t at = kSummaryHeaderSize + i * kEntryHeaderSize;
        InspectedEntry entry;
        entry.header = decode_entry_header(image.subspan(at).first<kEntryHeaderSize>());

        const uint64_t end = static_cast<uint64_t>(entry.header.data_offset) + entry.header.size;
        entry.in_bounds = entry.header.data_offset >= result.summary.header_size && end <= image.size();
        if (entry.in_bounds)
        {
            entry.actual_crc32 = crc32(image.subspan(entry.header.data_offset, entry.header.size));
            entry.checksum_ok = entry.actual_crc32 == entry.header.crc32;
        }

        if (!entry.in_bounds || !entry.checksum_ok)
        {
            LOGGER_WARN("entry {}: offset 0x{:X} size {} {}", i, entry.header.data_offset,
                        entry.header.size,
                        entry.in_bounds ? fmt::format("crc 0x{:08X} != stored 0x{:08X}",
                                                      entry.actual_crc32, entry.header.crc32)
                                        : std::string("runs outside the payload region"));
        }
        result.entries.push_back(entry);
    }

    LOGGER_DEBUG("inspected {} entries, header 0x{:X}, file {} bytes", result.entries.size(),
                 result.summary.header_size, result.file_size);
    return R::ok(std::move(result));
}

} // namespace aiomerge::engine
