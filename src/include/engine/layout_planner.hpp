#pragma once
/**
 * @file layout_planner.hpp
 * @brief Resolves where every image goes in the output.
 */
#include <vector>

#include "aiomerge_export.h"
#include "engine/merge_error.hpp"
#include "engine/merge_types.hpp"

namespace aiomerge::engine
{

/**
 * @brief Plans the layout for @p entries (entry 0 is the base, already stripped).
 *
 * Placement rules:
 * - header size = 0x20 + count * 0x50;
 * - a cursor starts at the header size; an entry without a requested offset is
 *   placed at the cursor; after every entry the cursor moves to its end;
 * - a requested offset is used verbatim when it is at or past the header,
 *   otherwise OffsetCollidesWithHeader;
 * - after sorting by offset, any two intersecting non-empty ranges give
 *   OverlappingPlacement (both request indices reported);
 * - total output size = max(header size, max end); uncovered bytes are gaps.
 *
 * Also fails with HeaderSizeOverflow (header size beyond u16 or count beyond
 * u8) and OutputTooLarge (size or end beyond u32).
 */
[[nodiscard]] AIOMERGE_EXPORT MergeResult<LayoutPlan> plan_layout(const std::vector<MergeEntry> &entries);

} // namespace aiomerge::engine
