#pragma once
/**
 * @file header_builder.hpp
 * @brief Builds the metadata region for a finished layout.
 */
#include <cstdint>
#include <vector>

#include "aiomerge_export.h"
#include "engine/format.hpp"
#include "engine/header_codec.hpp"
#include "engine/merge_types.hpp"

namespace aiomerge::engine
{

/** @brief Summary header describing @p plan. */
[[nodiscard]] AIOMERGE_EXPORT SummaryHeader make_summary_header(const LayoutPlan &plan,
                                                                const FormatIdentity &identity);

/** @brief Entry header for one placed entry. */
[[nodiscard]] AIOMERGE_EXPORT EntryHeader make_entry_header(const PlacedEntry &entry,
                                                            uint32_t checksum,
                                                            const FormatIdentity &identity);

/**
 * @brief Encodes the whole metadata region: the summary header, then one entry
 * header per placed entry in plan (ascending offset) order.
 *
 * @param checksums One CRC per plan entry, same order as plan.entries.
 * @return Exactly plan.total_header_size bytes.
 * @throws std::invalid_argument if checksums and entries differ in count.
 */
[[nodiscard]] AIOMERGE_EXPORT std::vector<uint8_t>
build_header_block(const LayoutPlan &plan, const std::vector<uint32_t> &checksums,
                   const FormatIdentity &identity);

} // namespace aiomerge::engine
