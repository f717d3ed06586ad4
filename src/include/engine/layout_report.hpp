#pragma once
/**
 * @file layout_report.hpp
 * @brief Human- and machine-readable description of a merge layout.
 *
 * The CLI prints the text form after every merge and can save the JSON form
 * next to the output image.
 *
 * JSON shape:
 * @code{.json}
 * {
 *   "header_size": 272, "total_size": 4624, "entry_count": 3, "gap_bytes": 84,
 *   "entries": [
 *     { "index": 0, "label": "main.bin", "offset": 272, "size": 4096,
 *       "end": 4368, "crc32": "0x1C291CA3", "gap_before": 0 }
 *   ]
 * }
 * @endcode
 */
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aiomerge_export.h"
#include "engine/merge_types.hpp"

namespace aiomerge::engine
{

struct ReportEntry
{
    size_t input_index{0};
    std::string label;
    uint32_t offset{0};
    uint32_t size{0};
    uint64_t end{0};
    uint32_t crc32{0};
    uint64_t gap_before{0}; ///< Zero-filled bytes between the previous region and this entry.
};

struct LayoutReport
{
    uint32_t header_size{0};
    uint32_t total_size{0};
    uint64_t gap_bytes{0};
    std::vector<ReportEntry> entries; ///< Plan (ascending offset) order.
};

/**
 * @brief Builds the report for @p plan.
 * @throws std::invalid_argument if checksums and entries differ in count.
 */
[[nodiscard]] AIOMERGE_EXPORT LayoutReport make_layout_report(const LayoutPlan &plan,
                                                              const std::vector<uint32_t> &checksums);

[[nodiscard]] AIOMERGE_EXPORT nlohmann::json to_json(const LayoutReport &report);

/** @brief Fixed-width table, one line per entry, offsets in hex. */
[[nodiscard]] AIOMERGE_EXPORT std::string to_text(const LayoutReport &report);

} // namespace aiomerge::engine
