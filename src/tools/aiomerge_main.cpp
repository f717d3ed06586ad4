/**
 * @file aiomerge_main.cpp
 * @brief aiomerge: packs a base firmware and extra images into one AIO image.
 *
 * ## Usage
 *
 *     aiomerge --base main.bin --target fw1.bin --target fw2.bin@0x4000 --output out.bin
 *     aiomerge --job merge.json                 # everything from a job file
 *     aiomerge --job merge.json --output x.bin  # flags override the job file
 *     aiomerge --inspect out.bin                # verify a packaged image
 *
 * Settings are layered: defaults, then the job file, then AIOMERGE_LOG_LEVEL /
 * AIOMERGE_LOG_FILE, then command-line flags. Targets given on the command line
 * replace the job file's target list.
 *
 * Exit codes: 0 success, 1 usage/config/I/O error, 2 merge rejected or
 * inspection failed.
 */

#include "aio_engine.hpp"
#include "tools/merge_cli.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace aiomerge;

int main(int argc, char *argv[])
{
    const char *prog = argc > 0 ? argv[0] : "aiomerge";
    cli::MergeArgs args;
    try
    {
        args = cli::parse_args(std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc));
    }
    catch (const cli::UsageError &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::print_usage(std::cerr, prog);
        return cli::kExitUsage;
    }
    if (args.show_help)
    {
        cli::print_usage(std::cout, prog);
        return cli::kExitOk;
    }

    auto logger_guard = basics::make_scope_guard([]() noexcept { utils::Logger::instance().shutdown(); });
    return cli::run(args, std::cout, std::cerr);
}
