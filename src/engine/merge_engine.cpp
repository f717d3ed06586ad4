// merge_engine.cpp
#include "engine/merge_engine.hpp"
#include "engine/assembler.hpp"
#include "engine/crc32.hpp"
#include "engine/header_builder.hpp"
#include "engine/header_detector.hpp"
#include "engine/layout_planner.hpp"
#include "utils/logger.hpp"

namespace aiomerge::engine
{

namespace
{

/// Base payload (header stripped) followed by the targets, as planner input.
MergeResult<std::vector<MergeEntry>> collect_entries(const MergeRequest &request, bool &base_was_packaged)
{
    using R = MergeResult<std::vector<MergeEntry>>;
    if (!request.base)
    {
        return R::error(MergeFailure{MergeError::EmptyInput, "no base image supplied", std::nullopt,
                                     std::nullopt, std::nullopt});
    }

    auto payload = extract_clean_payload(*request.base);
    if (payload.is_error())
        return R::error(payload.error());
    base_was_packaged = payload.content().size() != request.base->size();

    std::vector<MergeEntry> entries;
    entries.reserve(1 + request.targets.size());
    entries.push_back(MergeEntry{std::move(payload).content(), std::nullopt, true});
    for (const auto &t : request.targets)
        entries.push_back(MergeEntry{t.image, t.offset, false});
    return R::ok(std::move(entries));
}

} // namespace

MergeResult<LayoutPlan> MergeEngine::plan(const MergeRequest &request) const
{
    bool packaged = false;
    auto entries = collect_entries(request, packaged);
    if (entries.is_error())
        return MergeResult<LayoutPlan>::error(entries.error());
    return plan_layout(entries.content());
}

MergeResult<MergeOutput> MergeEngine::merge(const MergeRequest &request) const
{
    using R = MergeResult<MergeOutput>;

    MergeOutput output;
    auto entries = collect_entries(request, output.base_was_packaged);
    if (entries.is_error())
    {
        LOGGER_WARN("merge rejected: {}: {}", to_string(entries.error().kind), entries.error().message);
        return R::error(entries.error());
    }

    auto plan = plan_layout(entries.content());
    if (plan.is_error())
    {
        LOGGER_WARN("merge rejected: {}: {}", to_string(plan.error().kind), plan.error().message);
        return R::error(plan.error());
    }
    output.plan = std::move(plan).content();

    output.checksums = compute_entry_checksums(output.plan, m_options.parallel_checksums);
    const auto header = build_header_block(output.plan, output.checksums, m_options.identity);
    output.image = assemble_image(header, output.plan);

    LOGGER_INFO("merged {} entries{}: header 0x{:X}, output 0x{:X} bytes", output.plan.entries.size(),
                output.base_was_packaged ? " (base re-packaged)" : "", output.plan.total_header_size,
                output.plan.total_output_size);
    return R::ok(std::move(output));
}

} // namespace aiomerge::engine
