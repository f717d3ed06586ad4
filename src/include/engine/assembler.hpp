#pragma once
/**
 * @file assembler.hpp
 * @brief Concatenates the header block and payloads into the output image.
 */
#include <cstdint>
#include <span>
#include <vector>

#include "aiomerge_export.h"
#include "engine/merge_types.hpp"

namespace aiomerge::engine
{

/**
 * @brief Produces the final image of exactly plan.total_output_size bytes.
 *
 * The header goes to offset 0, each payload to its absolute offset, and every
 * other byte is 0x00. The plan guarantees disjoint destinations.
 *
 * @throws std::invalid_argument if @p header is not plan.total_header_size
 *         bytes or an entry does not fit the output.
 */
[[nodiscard]] AIOMERGE_EXPORT std::vector<uint8_t> assemble_image(std::span<const uint8_t> header,
                                                                  const LayoutPlan &plan);

} // namespace aiomerge::engine
