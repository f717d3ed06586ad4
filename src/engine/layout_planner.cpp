// layout_planner.cpp
#include "engine/layout_planner.hpp"
#include "engine/format.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <limits>

#include <fmt/format.h>

namespace aiomerge::engine
{

namespace
{

constexpr uint64_t kU32Limit = std::numeric_limits<uint32_t>::max();

MergeResult<LayoutPlan> fail(MergeError kind, std::string message,
                             std::optional<size_t> first = std::nullopt,
                             std::optional<size_t> second = std::nullopt,
                             std::optional<uint64_t> offset = std::nullopt)
{
    LOGGER_DEBUG("plan_layout rejected: {}: {}", to_string(kind), message);
    return MergeResult<LayoutPlan>::error(
        MergeFailure{kind, std::move(message), first, second, offset});
}

std::string describe(const PlacedEntry &e)
{
    return fmt::format("#{} '{}' [0x{:X}, 0x{:X})", e.input_index, e.image.label(),
                       e.absolute_offset, e.end());
}

} // namespace

MergeResult<LayoutPlan> plan_layout(const std::vector<MergeEntry> &entries)
{
    if (entries.empty())
        return fail(MergeError::EmptyInput, "nothing to place: no base image");

    const uint64_t entry_count = entries.size();
    const uint64_t header_size = header_size_for(entry_count);
    if (entry_count > kMaxEntryCount)
    {
        return fail(MergeError::HeaderSizeOverflow,
                    fmt::format("{} entries do not fit the 8-bit entry count field (max {})",
                                entry_count, kMaxEntryCount));
    }
    if (header_size > kMaxHeaderSize)
    {
        return fail(MergeError::HeaderSizeOverflow,
                    fmt::format("header size 0x{:X} does not fit the 16-bit header size field",
                                header_size));
    }

    // 1. Resolve offsets in request order.
    std::vector<PlacedEntry> placed;
    placed.reserve(entries.size());
    uint64_t cursor = header_size;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        const MergeEntry &entry = entries[i];
        const uint64_t size = entry.image.size();
        if (size > kU32Limit)
        {
            return fail(MergeError::OutputTooLarge,
                        fmt::format("entry #{} '{}' is {} bytes; the size field is 32-bit", i,
                                    entry.image.label(), size),
                        i);
        }

        uint64_t offset = cursor;
        if (entry.requested_offset)
        {
            offset = *entry.requested_offset;
            if (offset < header_size)
            {
                return fail(MergeError::OffsetCollidesWithHeader,
                            fmt::format("entry #{} '{}' requested offset 0x{:X}, inside the "
                                        "0x{:X}-byte header region",
                                        i, entry.image.label(), offset, header_size),
                            i, std::nullopt, offset);
            }
        }

        const uint64_t end = offset + size;
        if (offset > kU32Limit || end > kU32Limit)
        {
            return fail(MergeError::OutputTooLarge,
                        fmt::format("entry #{} '{}' would end at 0x{:X}, beyond the 32-bit offset range",
                                    i, entry.image.label(), end),
                        i, std::nullopt, offset);
        }

        placed.push_back(PlacedEntry{entry.image, static_cast<uint32_t>(offset),
                                     static_cast<uint32_t>(size), i});
        cursor = end;
    }

    // 2. Order by offset and reject intersections. With the list sorted, an
    //    entry can only collide with the furthest-reaching entry before it.
    std::stable_sort(placed.begin(), placed.end(), [](const PlacedEntry &a, const PlacedEntry &b) {
        return a.absolute_offset < b.absolute_offset;
    });

    const PlacedEntry *reach = nullptr;
    for (const auto &current : placed)
    {
        if (current.size == 0)
            continue;
        if (reach != nullptr && current.absolute_offset < reach->end())
        {
            const size_t a = std::min(reach->input_index, current.input_index);
            const size_t b = std::max(reach->input_index, current.input_index);
            return fail(MergeError::OverlappingPlacement,
                        fmt::format("{} overlaps {}", describe(*reach), describe(current)), a, b,
                        current.absolute_offset);
        }
        if (reach == nullptr || current.end() > reach->end())
            reach = &current;
    }

    // 3. Totals.
    uint64_t total = header_size;
    for (const auto &e : placed)
        total = std::max(total, e.end());

    LayoutPlan plan;
    plan.entries = std::move(placed);
    plan.total_header_size = static_cast<uint32_t>(header_size);
    plan.total_output_size = static_cast<uint32_t>(total);

    LOGGER_DEBUG("planned {} entries: header 0x{:X}, output 0x{:X} bytes", plan.entries.size(),
                 plan.total_header_size, plan.total_output_size);
    return MergeResult<LayoutPlan>::ok(std::move(plan));
}

} // namespace aiomerge::engine
