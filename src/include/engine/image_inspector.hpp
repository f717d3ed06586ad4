#pragma once
/**
 * @file image_inspector.hpp
 * @brief Reads back and verifies a packaged image.
 */
#include <cstdint>
#include <span>
#include <vector>

#include "aiomerge_export.h"
#include "engine/header_codec.hpp"
#include "engine/merge_error.hpp"

namespace aiomerge::engine
{

struct InspectedEntry
{
    EntryHeader header;
    bool in_bounds{false};     ///< [data_offset, data_offset + size) lies inside the file.
    uint32_t actual_crc32{0};  ///< Recomputed CRC; 0 when out of bounds.
    bool checksum_ok{false};
};

struct InspectedImage
{
    SummaryHeader summary;
    std::vector<InspectedEntry> entries;
    uint64_t file_size{0};

    /** @brief True when every entry is in bounds and its CRC matches. */
    [[nodiscard]] bool all_verified() const noexcept;
};

/**
 * @brief Decodes the headers of @p image and checks every entry's CRC.
 *
 * Fails with NotPackaged when the magic is missing and MalformedHeader when
 * the declared header size is shorter than the entry count requires or runs
 * past the end of the file. Bad entries are reported per entry, not as errors.
 */
[[nodiscard]] AIOMERGE_EXPORT MergeResult<InspectedImage> inspect_image(std::span<const uint8_t> image);

} // namespace aiomerge::engine
