#pragma once
/**
 * @file merge_engine.hpp
 * @brief Runs the merge pipeline for one request.
 *
 * Pipeline: extract_clean_payload -> plan_layout -> compute_entry_checksums
 * -> build_header_block -> assemble_image.
 *
 * The engine only sees in-memory buffers. Loading the inputs and writing the
 * result belong to the caller. A MergeEngine holds its options and nothing
 * else, so one instance can serve any number of merges from any thread.
 *
 * @code
 *   MergeRequest req;
 *   req.base = RawImage(read_file_bytes("main.bin", ec), "main.bin");
 *   req.targets.push_back({RawImage(std::move(fw1), "fw1.bin"), std::nullopt});
 *   req.targets.push_back({RawImage(std::move(fw2), "fw2.bin"), 0x4000u});
 *
 *   auto result = MergeEngine{}.merge(req);
 *   if (result.is_error())
 *       LOGGER_ERROR("{}", result.error().message);
 * @endcode
 */
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "aiomerge_export.h"
#include "engine/format.hpp"
#include "engine/merge_error.hpp"
#include "engine/merge_types.hpp"

namespace aiomerge::engine
{

struct TargetSpec
{
    RawImage image;
    std::optional<uint32_t> offset; ///< Absolute offset; nullopt = right after the previous entry.
};

struct MergeRequest
{
    std::optional<RawImage> base; ///< Required; may itself be a previously packaged image.
    std::vector<TargetSpec> targets;
};

struct MergeOptions
{
    FormatIdentity identity{};
    bool parallel_checksums{false};
};

struct MergeOutput
{
    std::vector<uint8_t> image;
    LayoutPlan plan;
    std::vector<uint32_t> checksums; ///< Same order as plan.entries.
    bool base_was_packaged{false};   ///< A previous header was found and stripped.
};

class AIOMERGE_EXPORT MergeEngine
{
  public:
    MergeEngine() = default;
    explicit MergeEngine(MergeOptions options) : m_options(std::move(options)) {}

    [[nodiscard]] const MergeOptions &options() const noexcept { return m_options; }

    /**
     * @brief Merges the request into one packaged image.
     *
     * Either returns a complete image or an error; never a partial buffer.
     * Errors: EmptyInput (no base), MalformedHeader (bad packaged base), and
     * every plan_layout failure.
     */
    [[nodiscard]] MergeResult<MergeOutput> merge(const MergeRequest &request) const;

    /**
     * @brief Runs detection and planning only; nothing is checksummed or assembled.
     */
    [[nodiscard]] MergeResult<LayoutPlan> plan(const MergeRequest &request) const;

  private:
    MergeOptions m_options;
};

} // namespace aiomerge::engine
