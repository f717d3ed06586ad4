/**
 * @file merge_cli.cpp
 * @brief aiomerge command-line runs.
 */
#include "aio_engine.hpp"
#include "tools/merge_cli.hpp"

#include <exception>
#include <optional>
#include <ostream>
#include <span>

namespace aiomerge::cli
{

using namespace aiomerge::engine;

namespace
{

std::optional<RawImage> load_image(const std::filesystem::path &path, std::ostream &err)
{
    std::error_code ec;
    auto bytes = utils::read_file_bytes(path, ec);
    if (ec)
    {
        LOGGER_ERROR("cannot read '{}': {}", path.string(), ec.message());
        err << "Cannot read '" << path.string() << "': " << ec.message() << "\n";
        return std::nullopt;
    }
    return RawImage(std::move(bytes), path.filename().string());
}

std::span<const uint8_t> as_bytes(const std::string &text)
{
    return {reinterpret_cast<const uint8_t *>(text.data()), text.size()};
}

} // namespace

MergeArgs parse_args(const std::vector<std::string> &argv)
{
    MergeArgs args;
    auto value_of = [&](size_t &i, std::string_view flag) -> std::string
    {
        if (i + 1 >= argv.size())
            throw UsageError(fmt::format("{} needs a value", flag));
        return argv[++i];
    };

    for (size_t i = 0; i < argv.size(); ++i)
    {
        const std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            args.show_help = true;
            return args;
        }
        if (arg == "--base")
            args.base = value_of(i, arg);
        else if (arg == "--target")
            args.targets.push_back(value_of(i, arg));
        else if (arg == "--output" || arg == "-o")
            args.output = value_of(i, arg);
        else if (arg == "--report")
            args.report = value_of(i, arg);
        else if (arg == "--job")
            args.job_path = value_of(i, arg);
        else if (arg == "--inspect")
            args.inspect_path = value_of(i, arg);
        else if (arg == "--log-level")
            args.log_level = value_of(i, arg);
        else if (arg == "--log-file")
            args.log_file = value_of(i, arg);
        else if (arg == "--parallel-checksums")
            args.parallel_checksums = true;
        else if (arg == "--dry-run")
            args.dry_run = true;
        else
            throw UsageError(fmt::format("unknown argument '{}'", arg));
    }

    if (args.inspect_path.empty() && args.job_path.empty() && args.base.empty())
        throw UsageError("--base <file>, --job <path.json> or --inspect <file> is required");
    return args;
}

void print_usage(std::ostream &os, std::string_view prog)
{
    os << "Usage:\n"
       << "  " << prog << " --base <file> [--target <file>[@<offset>]]... --output <file> [options]\n"
       << "  " << prog << " --job <job.json> [options]\n"
       << "  " << prog << " --inspect <file> [--log-level <lvl>]\n\n"
       << "Options:\n"
       << "  --base <file>           Base firmware (may already carry an AIO header)\n"
       << "  --target <file>[@off]   Extra image; offset is decimal or 0x hex, omitted = sequential\n"
       << "  --output <file>         Packaged image to write (replaced atomically)\n"
       << "  --report <file.json>    Also write the layout report as JSON\n"
       << "  --job <job.json>        Load settings from a job file (flags override it)\n"
       << "  --parallel-checksums    Compute entry CRCs concurrently\n"
       << "  --dry-run               Plan and print the layout; write nothing\n"
       << "  --inspect <file>        Decode and verify a packaged image; exit 0 if all CRCs match\n"
       << "  --log-level <lvl>       trace | debug | info | warn | error | system\n"
       << "  --log-file <path>       Log to a file instead of stderr\n"
       << "  --help                  Show this message\n";
}

MergeJob resolve_job(const MergeArgs &args)
{
    MergeJob job;
    if (!args.job_path.empty())
        job = MergeJob::from_json_file(args.job_path);
    job.apply_environment();

    if (!args.base.empty())
        job.base = args.base;
    if (!args.targets.empty())
    {
        job.targets.clear();
        for (const auto &t : args.targets)
            job.targets.push_back(parse_target_argument(t));
    }
    if (!args.output.empty())
        job.output = args.output;
    if (!args.report.empty())
        job.report = args.report;
    if (args.parallel_checksums)
        job.parallel_checksums = true;
    if (!args.log_level.empty())
    {
        const auto lvl = utils::Logger::level_from_string(args.log_level);
        if (!lvl)
            throw std::runtime_error(fmt::format("--log-level: unknown level '{}'", args.log_level));
        job.log.level = *lvl;
    }
    if (!args.log_file.empty())
        job.log.file = args.log_file;
    return job;
}

int run_inspect(const std::filesystem::path &path, std::ostream &out, std::ostream &err)
{
    std::error_code ec;
    const auto bytes = utils::read_file_bytes(path, ec);
    if (ec)
    {
        err << "Cannot read '" << path.string() << "': " << ec.message() << "\n";
        return kExitUsage;
    }

    auto inspected = inspect_image(bytes);
    if (inspected.is_error())
    {
        err << to_string(inspected.error().kind) << ": " << inspected.error().message << "\n";
        return kExitRejected;
    }

    const auto &img = inspected.content();
    out << fmt::format("{}: AIO v{}, device 0x{:02X}, fw 0x{:08X}, header 0x{:X}, {} entries, {}\n",
                       path.filename().string(), img.summary.version, img.summary.device_type,
                       img.summary.fw_version, img.summary.header_size, img.entries.size(),
                       format_tools::human_size(img.file_size));
    for (size_t i = 0; i < img.entries.size(); ++i)
    {
        const auto &e = img.entries[i];
        out << fmt::format("  #{:<3} offset 0x{:08X} size {:>10} crc 0x{:08X}  {}\n", i, e.header.data_offset,
                           e.header.size, e.header.crc32,
                           !e.in_bounds     ? "OUT OF BOUNDS"
                           : e.checksum_ok ? "ok"
                                           : fmt::format("MISMATCH (0x{:08X})", e.actual_crc32));
    }
    return img.all_verified() ? kExitOk : kExitRejected;
}

int run_merge(const MergeJob &job, bool dry_run, std::ostream &out, std::ostream &err)
{
    if (job.base.empty())
    {
        err << "Error: no base image (--base or \"base\" in the job file)\n";
        return kExitUsage;
    }
    if (job.output.empty() && !dry_run)
    {
        err << "Error: no output file (--output or \"output\" in the job file)\n";
        return kExitUsage;
    }

    MergeRequest request;
    request.base = load_image(job.base, err);
    if (!request.base)
        return kExitUsage;
    for (const auto &t : job.targets)
    {
        auto image = load_image(t.path, err);
        if (!image)
            return kExitUsage;
        request.targets.push_back(TargetSpec{std::move(*image), t.offset});
    }

    const MergeEngine engine(MergeOptions{job.identity, job.parallel_checksums});
    auto result = engine.merge(request);
    if (result.is_error())
    {
        const auto &failure = result.error();
        err << "Merge rejected: " << to_string(failure.kind) << ": " << failure.message << "\n";
        return kExitRejected;
    }

    const auto &merged = result.content();
    const auto report = make_layout_report(merged.plan, merged.checksums);
    out << to_text(report);

    if (dry_run)
    {
        LOGGER_INFO("dry run: nothing written");
        return kExitOk;
    }

    std::error_code ec;
    if (!job.report.empty())
    {
        const std::string text = to_json(report).dump(2) + "\n";
        if (!utils::write_file_atomic(job.report, as_bytes(text), ec))
        {
            err << "Cannot write report '" << job.report.string() << "': " << ec.message() << "\n";
            return kExitUsage;
        }
    }

    if (!utils::write_file_atomic(job.output, merged.image, ec))
    {
        err << "Cannot write '" << job.output.string() << "': " << ec.message() << "\n";
        return kExitUsage;
    }
    out << fmt::format("Wrote {} ({})\n", job.output.string(), format_tools::human_size(merged.image.size()));
    return kExitOk;
}

int run(const MergeArgs &args, std::ostream &out, std::ostream &err)
{
    MergeJob job;
    try
    {
        job = resolve_job(args);
        apply_logging(job.log);
    }
    catch (const std::exception &e)
    {
        err << "Config error: " << e.what() << "\n";
        return kExitUsage;
    }

    try
    {
        if (!args.inspect_path.empty())
            return run_inspect(args.inspect_path, out, err);
        return run_merge(job, args.dry_run, out, err);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("aiomerge failed: {}", e.what());
        err << "Error: " << e.what() << "\n";
        return kExitUsage;
    }
}

} // namespace aiomerge::cli
