#pragma once
/**
 * @file merge_types.hpp
 * @brief Value types passed between the merge pipeline stages.
 */
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "aiomerge_export.h"

namespace aiomerge::engine
{

/**
 * @class RawImage
 * @brief Immutable view of an image's bytes.
 *
 * The bytes live in a shared, immutable buffer; a RawImage is a window
 * (offset, length) into it. Stripping a header therefore never copies, and
 * copies of a RawImage are cheap.
 */
class AIOMERGE_EXPORT RawImage
{
  public:
    RawImage() = default;

    /// Takes ownership of @p bytes.
    explicit RawImage(std::vector<uint8_t> bytes, std::string label = {});

    /// Window [offset, offset + length) of this image. Throws std::out_of_range if it does not fit.
    [[nodiscard]] RawImage slice(size_t offset, size_t length) const;

    /// Everything from @p offset to the end.
    [[nodiscard]] RawImage tail_from(size_t offset) const;

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept;
    [[nodiscard]] size_t size() const noexcept { return m_length; }
    [[nodiscard]] bool empty() const noexcept { return m_length == 0; }

    /// Display name (usually the source file name) used in reports and errors.
    [[nodiscard]] const std::string &label() const noexcept { return m_label; }
    void set_label(std::string label) { m_label = std::move(label); }

  private:
    std::shared_ptr<const std::vector<uint8_t>> m_storage;
    size_t m_offset{0};
    size_t m_length{0};
    std::string m_label;
};

/**
 * @struct MergeEntry
 * @brief One image to place, with an optional user-requested absolute offset.
 */
struct MergeEntry
{
    RawImage image;
    std::optional<uint32_t> requested_offset;
    bool is_base{false};
};

/**
 * @struct PlacedEntry
 * @brief An image with its resolved placement.
 */
struct PlacedEntry
{
    RawImage image;
    uint32_t absolute_offset{0};
    uint32_t size{0};
    size_t input_index{0}; ///< Position in the request: 0 = base, 1.. = targets.

    [[nodiscard]] uint64_t end() const noexcept
    {
        return static_cast<uint64_t>(absolute_offset) + size;
    }
};

/**
 * @struct LayoutPlan
 * @brief Resolved placement of every entry.
 *
 * Invariants (established by plan_layout):
 * - entries are sorted by ascending absolute_offset;
 * - non-empty [offset, offset + size) ranges are pairwise disjoint;
 * - absolute_offset >= total_header_size for every entry.
 */
struct LayoutPlan
{
    std::vector<PlacedEntry> entries;
    uint32_t total_header_size{0};
    uint32_t total_output_size{0};
};

} // namespace aiomerge::engine
