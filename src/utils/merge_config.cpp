/**
 * @file merge_config.cpp
 * @brief MergeJob JSON parsing and environment overrides.
 */
#include "aio_service.hpp"
#include "utils/merge_config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace aiomerge
{

namespace fs = std::filesystem;

namespace
{

/// Reads an unsigned field given either as a JSON integer or a decimal/hex string.
uint32_t parse_unsigned(const nlohmann::json &v, const std::string &key, uint32_t max_value)
{
    std::optional<uint32_t> parsed;
    if (v.is_number_unsigned())
    {
        const auto raw = v.get<uint64_t>();
        if (raw <= std::numeric_limits<uint32_t>::max())
            parsed = static_cast<uint32_t>(raw);
    }
    else if (v.is_number_integer())
    {
        const auto raw = v.get<int64_t>();
        if (raw >= 0 && raw <= std::numeric_limits<uint32_t>::max())
            parsed = static_cast<uint32_t>(raw);
    }
    else if (v.is_string())
    {
        parsed = format_tools::parse_u32(v.get<std::string>());
    }

    if (!parsed || *parsed > max_value)
    {
        throw std::runtime_error(fmt::format("Merge job: invalid '{}' = {} (expected an integer 0..0x{:X})",
                                             key, v.dump(), max_value));
    }
    return *parsed;
}

template <typename T>
void read_field(const nlohmann::json &j, const char *key, T &out)
{
    if (j.contains(key))
        out = static_cast<T>(parse_unsigned(j.at(key), key, std::numeric_limits<T>::max()));
}

fs::path resolve_path(const fs::path &base_dir, const std::string &raw)
{
    if (raw.empty())
        return {};
    fs::path p(raw);
    if (p.is_absolute() || base_dir.empty())
        return p;
    return base_dir / p;
}

std::string required_string(const nlohmann::json &j, const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string() || j.at(key).get<std::string>().empty())
        throw std::runtime_error(fmt::format("Merge job: missing required field '{}'", key));
    return j.at(key).get<std::string>();
}

std::optional<uint32_t> parse_offset(const nlohmann::json &target, size_t index)
{
    if (!target.contains("offset") || target.at("offset").is_null())
        return std::nullopt;
    const auto &v = target.at("offset");
    if (v.is_string() && v.get<std::string>().find_first_not_of(" \t") == std::string::npos)
        return std::nullopt;
    return parse_unsigned(v, fmt::format("targets[{}].offset", index),
                          std::numeric_limits<uint32_t>::max());
}

LoggingConfig parse_logging(const nlohmann::json &j)
{
    LoggingConfig cfg;
    if (!j.is_object())
        return cfg;
    const std::string level = j.value("level", std::string{"info"});
    const auto parsed = utils::Logger::level_from_string(level);
    if (!parsed)
    {
        throw std::runtime_error(fmt::format(
            "Merge job: invalid 'log.level' = '{}' (trace, debug, info, warn, error, system)", level));
    }
    cfg.level = *parsed;
    cfg.file = j.value("file", std::string{});
    return cfg;
}

} // namespace

engine::FormatIdentity parse_format_identity(const nlohmann::json &j, engine::FormatIdentity defaults)
{
    engine::FormatIdentity id = defaults;
    if (j.is_null())
        return id;
    if (!j.is_object())
        throw std::runtime_error("Merge job: 'format' must be an object");

    read_field(j, "version", id.version);
    read_field(j, "device_type", id.device_type);
    read_field(j, "fw_version", id.fw_version);
    read_field(j, "update_ctrl", id.update_ctrl);
    read_field(j, "vendor_id", id.vendor_id);
    read_field(j, "product_id", id.product_id);
    read_field(j, "unique_id", id.unique_id);
    read_field(j, "entry_fw_version", id.entry_fw_version);
    return id;
}

MergeJob MergeJob::from_json(const nlohmann::json &j, const fs::path &base_dir)
{
    if (!j.is_object())
        throw std::runtime_error("Merge job: top level must be a JSON object");

    MergeJob job;
    job.base = resolve_path(base_dir, required_string(j, "base"));
    job.output = resolve_path(base_dir, j.value("output", std::string{}));
    job.report = resolve_path(base_dir, j.value("report", std::string{}));
    job.parallel_checksums = j.value("parallel_checksums", false);

    if (j.contains("targets"))
    {
        const auto &targets = j.at("targets");
        if (!targets.is_array())
            throw std::runtime_error("Merge job: 'targets' must be an array");
        for (size_t i = 0; i < targets.size(); ++i)
        {
            const auto &t = targets.at(i);
            TargetJob tj;
            if (t.is_string())
            {
                tj.path = resolve_path(base_dir, t.get<std::string>());
            }
            else if (t.is_object())
            {
                tj.path = resolve_path(base_dir, required_string(t, "path"));
                tj.offset = parse_offset(t, i);
            }
            else
            {
                throw std::runtime_error(
                    fmt::format("Merge job: targets[{}] must be a path string or an object", i));
            }
            job.targets.push_back(std::move(tj));
        }
    }

    if (j.contains("format"))
        job.identity = parse_format_identity(j.at("format"));
    if (j.contains("log"))
    {
        job.log = parse_logging(j.at("log"));
        job.log.file = resolve_path(base_dir, job.log.file).string();
    }
    return job;
}

MergeJob MergeJob::from_json_file(const fs::path &path)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error(fmt::format("Merge job: cannot open '{}'", path.string()));

    nlohmann::json j;
    try
    {
        in >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(fmt::format("Merge job: '{}' is not valid JSON: {}", path.string(), e.what()));
    }
    return from_json(j, path.parent_path());
}

void MergeJob::apply_environment()
{
    if (const char *level = std::getenv("AIOMERGE_LOG_LEVEL"); level != nullptr && *level != '\0')
    {
        const auto parsed = utils::Logger::level_from_string(level);
        if (!parsed)
            throw std::runtime_error(fmt::format("AIOMERGE_LOG_LEVEL: unknown level '{}'", level));
        log.level = *parsed;
    }
    if (const char *file = std::getenv("AIOMERGE_LOG_FILE"); file != nullptr && *file != '\0')
    {
        log.file = file;
    }
}

TargetJob parse_target_argument(std::string_view arg)
{
    TargetJob tj;
    const auto at = arg.rfind('@');
    if (at == std::string_view::npos)
    {
        tj.path = std::string(arg);
    }
    else
    {
        tj.path = std::string(arg.substr(0, at));
        const std::string_view offset_text = arg.substr(at + 1);
        if (!offset_text.empty())
        {
            tj.offset = format_tools::parse_u32(offset_text);
            if (!tj.offset)
                throw std::runtime_error(fmt::format("invalid offset '{}' in target '{}'", offset_text, arg));
        }
    }
    if (tj.path.empty())
        throw std::runtime_error(fmt::format("target '{}' has no file path", arg));
    return tj;
}

void apply_logging(const LoggingConfig &cfg)
{
    auto &logger = utils::Logger::instance();
    logger.set_level(cfg.level);
    if (cfg.file.empty())
    {
        logger.set_console();
    }
    else if (!logger.set_logfile(cfg.file))
    {
        throw std::runtime_error(fmt::format("cannot open log file '{}'", cfg.file));
    }
}

} // namespace aiomerge
