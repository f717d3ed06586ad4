#pragma once
/**
 * @file header_detector.hpp
 * @brief Strips a previous run's metadata block from a base image.
 */
#include "aiomerge_export.h"
#include "engine/merge_error.hpp"
#include "engine/merge_types.hpp"

namespace aiomerge::engine
{

/**
 * @brief Returns the clean payload of a base image.
 *
 * - No "AIOH" magic: the whole input, unchanged.
 * - Magic present: everything from the declared header size (u16 at 0x06)
 *   onwards. The declared size must satisfy 4 <= size <= image length;
 *   otherwise, or if the image is too short to hold the field, the result is
 *   MalformedHeader.
 *
 * The returned payload shares the input's storage and keeps its label.
 */
[[nodiscard]] AIOMERGE_EXPORT MergeResult<RawImage> extract_clean_payload(const RawImage &base);

} // namespace aiomerge::engine
