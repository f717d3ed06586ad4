/**
 * @file test_layout_planner.cpp
 * @brief Offset resolution, overlap detection and size limits of plan_layout.
 */
#include "aio_engine.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace aiomerge::engine;
using namespace aiomerge::tests::helper;

namespace
{

MergeEntry base_entry(size_t size)
{
    return MergeEntry{RawImage(make_filled(size, 0xAA), "base.bin"), std::nullopt, true};
}

MergeEntry target_entry(size_t size, std::optional<uint32_t> offset, std::string label = "fw.bin")
{
    return MergeEntry{RawImage(make_filled(size, 0x55), std::move(label)), offset, false};
}

} // namespace

TEST(LayoutPlannerTest, EmptyRequestIsRejected)
{
    auto r = plan_layout({});
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, MergeError::EmptyInput);
}

TEST(LayoutPlannerTest, SingleBaseGoesRightAfterHeader)
{
    auto r = plan_layout({base_entry(16)});
    ASSERT_TRUE(r.is_ok());
    const auto &plan = r.content();
    EXPECT_EQ(plan.total_header_size, 0x70u);
    EXPECT_EQ(plan.total_output_size, 0x70u + 16);
    ASSERT_EQ(plan.entries.size(), 1u);
    EXPECT_EQ(plan.entries[0].absolute_offset, 0x70u);
    EXPECT_EQ(plan.entries[0].size, 16u);
    EXPECT_EQ(plan.entries[0].input_index, 0u);
}

TEST(LayoutPlannerTest, SequentialTargetFollowsBase)
{
    auto r = plan_layout({base_entry(16), target_entry(32, std::nullopt)});
    ASSERT_TRUE(r.is_ok());
    const auto &plan = r.content();
    const uint32_t hs = 0xC0;
    EXPECT_EQ(plan.total_header_size, hs);
    EXPECT_EQ(plan.entries[0].absolute_offset, hs);
    EXPECT_EQ(plan.entries[1].absolute_offset, hs + 16);
    EXPECT_EQ(plan.total_output_size, hs + 16 + 32);
}

TEST(LayoutPlannerTest, ExplicitOffsetLeavesGap)
{
    const uint32_t hs = 0xC0;
    auto r = plan_layout({base_entry(16), target_entry(8, hs + 100)});
    ASSERT_TRUE(r.is_ok());
    const auto &plan = r.content();
    EXPECT_EQ(plan.entries[1].absolute_offset, hs + 100);
    EXPECT_EQ(plan.entries[1].absolute_offset - plan.entries[0].end(), 84u);
    EXPECT_EQ(plan.total_output_size, hs + 108);
}

TEST(LayoutPlannerTest, ExplicitOffsetAtHeaderBoundaryIsAccepted)
{
    const uint32_t hs = 0xC0;
    auto r = plan_layout({base_entry(0), target_entry(8, hs)});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().entries.front().absolute_offset, hs);
}

TEST(LayoutPlannerTest, ExplicitOffsetInsideHeaderIsRejected)
{
    auto r = plan_layout({base_entry(16), target_entry(8, 0x50)});
    ASSERT_TRUE(r.is_error());
    const auto &err = r.error();
    EXPECT_EQ(err.kind, MergeError::OffsetCollidesWithHeader);
    EXPECT_EQ(err.first_index, 1u);
    EXPECT_EQ(err.offset, 0x50u);
    EXPECT_NE(err.message.find("0x50"), std::string::npos);

    // One byte short of the header end still collides.
    auto edge = plan_layout({base_entry(16), target_entry(8, 0xBF)});
    ASSERT_TRUE(edge.is_error());
    EXPECT_EQ(edge.error().kind, MergeError::OffsetCollidesWithHeader);
}

TEST(LayoutPlannerTest, CursorFollowsExplicitEntries)
{
    // base [0x110, 0x120), t1 explicit [0x400, 0x410), t2 sequential -> 0x410
    auto r = plan_layout({base_entry(16), target_entry(16, 0x400), target_entry(4, std::nullopt)});
    ASSERT_TRUE(r.is_ok());
    const auto &plan = r.content();
    ASSERT_EQ(plan.entries.size(), 3u);
    EXPECT_EQ(plan.entries[2].input_index, 2u);
    EXPECT_EQ(plan.entries[2].absolute_offset, 0x410u);
}

TEST(LayoutPlannerTest, EntriesAreSortedByOffset)
{
    // t1 high, t2 low: plan order is base, t2, t1.
    auto r = plan_layout({base_entry(16), target_entry(16, 0x800, "hi"), target_entry(16, 0x200, "lo")});
    ASSERT_TRUE(r.is_ok());
    const auto &entries = r.content().entries;
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].input_index, 0u);
    EXPECT_EQ(entries[1].input_index, 2u);
    EXPECT_EQ(entries[1].image.label(), "lo");
    EXPECT_EQ(entries[2].input_index, 1u);
    EXPECT_EQ(r.content().total_output_size, 0x810u);
}

TEST(LayoutPlannerTest, OverlapWithBaseIsRejected)
{
    // base [0xC0, 0x1C0); target at 0x150 lands inside it.
    auto r = plan_layout({base_entry(0x100), target_entry(16, 0x150)});
    ASSERT_TRUE(r.is_error());
    const auto &err = r.error();
    EXPECT_EQ(err.kind, MergeError::OverlappingPlacement);
    EXPECT_EQ(err.first_index, 0u);
    EXPECT_EQ(err.second_index, 1u);
    EXPECT_EQ(err.offset, 0x150u);
}

TEST(LayoutPlannerTest, OverlapBetweenTargetsReportsBothIndices)
{
    // t2 [0x180, 0x280) sorts before t1 [0x200, 0x300).
    auto r = plan_layout({base_entry(16), target_entry(0x100, 0x200), target_entry(0x100, 0x180)});
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, MergeError::OverlappingPlacement);
    EXPECT_EQ(r.error().first_index, 1u);
    EXPECT_EQ(r.error().second_index, 2u);
}

TEST(LayoutPlannerTest, OverlapInsideLongerEntryIsFound)
{
    // t1 [0x200, 0x600) covers t2 [0x300, 0x310) and t3 [0x500, 0x510).
    auto r = plan_layout({base_entry(16), target_entry(0x400, 0x200), target_entry(16, 0x300),
                          target_entry(16, 0x500)});
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, MergeError::OverlappingPlacement);
    EXPECT_EQ(r.error().first_index, 1u);
    EXPECT_EQ(r.error().second_index, 2u);
}

TEST(LayoutPlannerTest, AdjacentEntriesDoNotOverlap)
{
    auto r = plan_layout({base_entry(16), target_entry(16, 0x200), target_entry(16, 0x210)});
    ASSERT_TRUE(r.is_ok());
}

TEST(LayoutPlannerTest, EmptyEntryInsideAnotherIsAccepted)
{
    auto r = plan_layout({base_entry(0x100), target_entry(0, 0x120)});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().total_output_size, 0xC0u + 0x100);
}

TEST(LayoutPlannerTest, AcceptedPlansNeverOverlap)
{
    std::vector<MergeEntry> entries{base_entry(100)};
    for (uint32_t i = 0; i < 20; ++i)
    {
        const std::optional<uint32_t> offset =
            (i % 3 == 0) ? std::optional<uint32_t>(0x4000 + i * 0x400) : std::nullopt;
        entries.push_back(target_entry(37 + i * 11, offset));
    }

    auto r = plan_layout(entries);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const auto &plan = r.content();
    for (size_t i = 0; i < plan.entries.size(); ++i)
    {
        EXPECT_GE(plan.entries[i].absolute_offset, plan.total_header_size);
        EXPECT_LE(plan.entries[i].end(), plan.total_output_size);
        if (i > 0)
        {
            EXPECT_LE(plan.entries[i - 1].end(), plan.entries[i].absolute_offset);
        }
    }
}

TEST(LayoutPlannerTest, HeaderSizeFormulaForOneToTwoHundredEntries)
{
    for (size_t n = 1; n <= 200; ++n)
    {
        std::vector<MergeEntry> entries{base_entry(1)};
        for (size_t i = 1; i < n; ++i)
            entries.push_back(target_entry(1, std::nullopt));

        auto r = plan_layout(entries);
        ASSERT_TRUE(r.is_ok()) << "n=" << n;
        const auto &plan = r.content();
        const uint32_t expected_hs = static_cast<uint32_t>(0x20 + n * 0x50);
        EXPECT_EQ(plan.total_header_size, expected_hs) << "n=" << n;
        EXPECT_EQ(plan.entries.front().absolute_offset, expected_hs) << "n=" << n;
        EXPECT_EQ(plan.total_output_size, expected_hs + n) << "n=" << n;
    }
}

TEST(LayoutPlannerTest, EntryCountLimit)
{
    std::vector<MergeEntry> entries{base_entry(1)};
    for (size_t i = 1; i < 255; ++i)
        entries.push_back(target_entry(1, std::nullopt));

    auto ok = plan_layout(entries);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.content().total_header_size, 0x20u + 255 * 0x50);

    entries.push_back(target_entry(1, std::nullopt));
    auto overflow = plan_layout(entries);
    ASSERT_TRUE(overflow.is_error());
    EXPECT_EQ(overflow.error().kind, MergeError::HeaderSizeOverflow);
}

TEST(LayoutPlannerTest, EndBeyond32BitsIsRejected)
{
    auto r = plan_layout({base_entry(16), target_entry(0x20, 0xFFFFFFF0u)});
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, MergeError::OutputTooLarge);
    EXPECT_EQ(r.error().first_index, 1u);
}
