// layout_report.cpp
#include "engine/layout_report.hpp"
#include "utils/format_tools.hpp"

#include <iterator>
#include <stdexcept>

#include <fmt/format.h>

namespace aiomerge::engine
{

LayoutReport make_layout_report(const LayoutPlan &plan, const std::vector<uint32_t> &checksums)
{
    if (checksums.size() != plan.entries.size())
    {
        throw std::invalid_argument(fmt::format("make_layout_report: {} checksums for {} entries",
                                                checksums.size(), plan.entries.size()));
    }

    LayoutReport report;
    report.header_size = plan.total_header_size;
    report.total_size = plan.total_output_size;

    uint64_t previous_end = plan.total_header_size;
    for (size_t i = 0; i < plan.entries.size(); ++i)
    {
        const PlacedEntry &e = plan.entries[i];
        ReportEntry r;
        r.input_index = e.input_index;
        r.label = e.image.label();
        r.offset = e.absolute_offset;
        r.size = e.size;
        r.end = e.end();
        r.crc32 = checksums[i];
        r.gap_before = e.absolute_offset > previous_end ? e.absolute_offset - previous_end : 0;
        report.gap_bytes += r.gap_before;
        if (r.end > previous_end)
            previous_end = r.end;
        report.entries.push_back(std::move(r));
    }
    return report;
}

nlohmann::json to_json(const LayoutReport &report)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto &e : report.entries)
    {
        entries.push_back({
            {"index", e.input_index},
            {"label", e.label},
            {"offset", e.offset},
            {"size", e.size},
            {"end", e.end},
            {"crc32", fmt::format("0x{:08X}", e.crc32)},
            {"gap_before", e.gap_before},
        });
    }
    return nlohmann::json{
        {"header_size", report.header_size},
        {"total_size", report.total_size},
        {"entry_count", report.entries.size()},
        {"gap_bytes", report.gap_bytes},
        {"entries", std::move(entries)},
    };
}

std::string to_text(const LayoutReport &report)
{
    fmt::memory_buffer mb;
    auto out = std::back_inserter(mb);
    fmt::format_to(out, "header 0x{:X} bytes, {} entries, total 0x{:X} bytes ({}), zero fill {} bytes\n",
                   report.header_size, report.entries.size(), report.total_size,
                   format_tools::human_size(report.total_size), report.gap_bytes);
    fmt::format_to(out, "  {:>3}  {:<24}  {:>10}  {:>10}  {:>10}  {:>10}  {:>8}\n", "#", "image",
                   "offset", "end", "size", "crc32", "gap");
    for (const auto &e : report.entries)
    {
        std::string label = e.label.empty() ? std::string("-") : e.label;
        if (label.size() > 24)
            label = "..." + label.substr(label.size() - 21);
        fmt::format_to(out, "  {:>3}  {:<24}  {:>#10x}  {:>#10x}  {:>10}  0x{:08X}  {:>8}\n",
                       e.input_index, label, e.offset, e.end, e.size, e.crc32, e.gap_before);
    }
    return fmt::to_string(mb);
}

} // namespace aiomerge::engine
