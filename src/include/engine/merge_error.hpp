#pragma once
/**
 * @file merge_error.hpp
 * @brief Failure kinds reported by the merge pipeline.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "utils/result.hpp"

namespace aiomerge::engine
{

/**
 * @brief Expected failure modes of a merge or an inspection.
 *
 * None of them is retried inside the engine; deciding what to change
 * (e.g. a target offset) is left to the caller.
 */
enum class MergeError
{
    MalformedHeader,          ///< Magic present but declared header size out of bounds.
    OffsetCollidesWithHeader, ///< Explicit offset inside the metadata region.
    OverlappingPlacement,     ///< Two entries' byte ranges intersect.
    HeaderSizeOverflow,       ///< Header size or entry count not representable.
    EmptyInput,               ///< No base image supplied.
    OutputTooLarge,           ///< Image length or end offset beyond the u32 fields.
    NotPackaged,              ///< Inspected file has no summary header.
};

inline const char *to_string(MergeError err) noexcept
{
    switch (err)
    {
    case MergeError::MalformedHeader:
        return "MalformedHeader";
    case MergeError::OffsetCollidesWithHeader:
        return "OffsetCollidesWithHeader";
    case MergeError::OverlappingPlacement:
        return "OverlappingPlacement";
    case MergeError::HeaderSizeOverflow:
        return "HeaderSizeOverflow";
    case MergeError::EmptyInput:
        return "EmptyInput";
    case MergeError::OutputTooLarge:
        return "OutputTooLarge";
    case MergeError::NotPackaged:
        return "NotPackaged";
    default:
        return "Unknown";
    }
}

/**
 * @struct MergeFailure
 * @brief A MergeError plus the context needed to explain it.
 *
 * Entry indices are request positions: 0 is the base, 1.. are targets in
 * the order given.
 */
struct MergeFailure
{
    MergeError kind{MergeError::EmptyInput};
    std::string message;
    std::optional<size_t> first_index;
    std::optional<size_t> second_index;
    std::optional<uint64_t> offset;
};

template <typename T>
using MergeResult = utils::Result<T, MergeFailure>;

} // namespace aiomerge::engine
