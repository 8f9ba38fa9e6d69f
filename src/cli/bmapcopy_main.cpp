/**
 * @file bmapcopy_main.cpp
 * @brief bmapcopy: copy a disk image to a file or block device using its block map.
 *
 * ## Usage
 *
 *     bmapcopy [options] <image> <destination>
 *
 *     bmapcopy --bmap disk.bmap disk.img /dev/sdb     # copy mapped blocks, verify, sync
 *     bmapcopy --no-verify --bmap disk.bmap disk.img out.img
 *     zcat disk.img.gz | bmapcopy --bmap disk.bmap - /dev/sdb
 *     bmapcopy disk.img out.img                       # no bmap: copy every block
 *
 * Settings come from built-in defaults, then the optional `--config` JSON file (see
 * copy_config.hpp), then the command-line flags.
 */
#include "bmc_core.hpp"
#include "copy_config.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace bmapcopy::utils;

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

struct CopyArgs
{
    std::string config_path;
    std::string bmap_path;
    std::string image_path;
    std::string dest_path;
    std::optional<uint64_t> image_size;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool no_verify{false};
    bool no_sync{false};
    bool no_tune{false};
    bool quiet{false};
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " [options] <image> <destination>\n\n"
        << "Options:\n"
        << "  --config <path>      JSON configuration file\n"
        << "  --bmap <path>        Block map of the image; without it every block is copied\n"
        << "  --image-size <N>     Size of the image data in bytes (e.g. after decompression)\n"
        << "  --no-verify          Do not verify range checksums\n"
        << "  --no-sync            Do not synchronize the destination at the end\n"
        << "  --no-tune            Do not tune block-device I/O settings\n"
        << "  --log-level <level>  trace, debug, info, warn, error or system\n"
        << "  --log-file <path>    Write the log to a file instead of the console\n"
        << "  --quiet              Do not show progress\n"
        << "  --version            Print the version and exit\n"
        << "  --help               Show this message\n\n"
        << "The image path '-' reads the image from standard input.\n";
}

[[noreturn]] void usage_error(const char *prog, const std::string &msg)
{
    std::cerr << "Error: " << msg << "\n\n";
    print_usage(prog);
    std::exit(1);
}

CopyArgs parse_args(int argc, char *argv[])
{
    CopyArgs args;
    std::vector<std::string> positional;
    auto value_of = [&](int &i, std::string_view flag) -> std::string
    {
        if (i + 1 >= argc)
            usage_error(argv[0], std::string(flag) + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--version")
        {
            std::cout << "bmapcopy " << bmapcopy::platform::get_version_string() << "\n";
            std::exit(0);
        }
        if (arg == "--config")
        {
            args.config_path = value_of(i, arg);
        }
        else if (arg == "--bmap")
        {
            args.bmap_path = value_of(i, arg);
        }
        else if (arg == "--image-size")
        {
            uint64_t size = 0;
            const std::string text = value_of(i, arg);
            if (!bmapcopy::format_tools::parse_u64(text, size))
                usage_error(argv[0], "invalid --image-size '" + text + "'");
            args.image_size = size;
        }
        else if (arg == "--no-verify")
        {
            args.no_verify = true;
        }
        else if (arg == "--no-sync")
        {
            args.no_sync = true;
        }
        else if (arg == "--no-tune")
        {
            args.no_tune = true;
        }
        else if (arg == "--log-level")
        {
            args.log_level = value_of(i, arg);
        }
        else if (arg == "--log-file")
        {
            args.log_file = value_of(i, arg);
        }
        else if (arg == "--quiet" || arg == "-q")
        {
            args.quiet = true;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            usage_error(argv[0], "unknown argument: " + std::string(arg));
        }
        else
        {
            positional.emplace_back(arg);
        }
    }
    if (positional.size() != 2)
    {
        usage_error(argv[0], "expected an image path and a destination path");
    }
    args.image_path = positional[0];
    args.dest_path = positional[1];
    return args;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const CopyArgs args = parse_args(argc, argv);

    // ── Load config ───────────────────────────────────────────────────────────
    bmapcopy::cli::CopyConfig config;
    if (!args.config_path.empty())
    {
        try
        {
            config = bmapcopy::cli::CopyConfig::from_json_file(args.config_path);
        }
        catch (const std::exception &e)
        {
            std::cerr << "Config error: " << e.what() << "\n";
            return 1;
        }
    }
    if (args.no_verify)
        config.verify = false;
    if (args.no_sync)
        config.sync = false;
    if (args.no_tune)
        config.tuning_enabled = false;
    if (args.quiet)
        config.progress = false;
    if (args.log_level)
        config.log_level = *args.log_level;
    if (args.log_file)
        config.log_file = *args.log_file;

    const auto level = Logger::parse_level(config.log_level);
    if (!level)
    {
        std::cerr << "Error: unknown log level '" << config.log_level << "'\n";
        return 1;
    }

    // ── Lifecycle guard ───────────────────────────────────────────────────────
    LifecycleGuard app_lifecycle(
        MakeModDefList(Logger::GetLifecycleModule(), bmapcopy::crypto::GetLifecycleModule()));

    auto &logger = Logger::instance();
    logger.set_level(*level);
    if (!config.log_file.empty() && !logger.set_logfile(config.log_file))
    {
        std::cerr << "Error: cannot open log file '" << config.log_file << "'\n";
        return 1;
    }

    // ── Copy ──────────────────────────────────────────────────────────────────
    try
    {
        std::optional<bmapcopy::bmap::BmapDocument> bmap;
        if (!args.bmap_path.empty())
        {
            bmap = bmapcopy::bmap::parse_bmap_file(args.bmap_path);
        }
        else
        {
            LOGGER_INFO("[copy] no bmap given, copying the entire image");
        }

        bmapcopy::bmap::CopyOptions options = config.to_copy_options();
        options.image_size = args.image_size;
        bmapcopy::bmap::ConsoleProgress console_progress;
        if (config.progress)
            options.progress = &console_progress;

        auto engine = bmapcopy::bmap::CopyEngine::open(args.image_path, args.dest_path,
                                                       std::move(bmap), std::move(options));
        const auto stats = engine->copy();
        LOGGER_INFO("[copy] done: {} blocks, {} bytes, image size {} bytes",
                    stats.blocks_written, stats.bytes_written, stats.image_size);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("[copy] {}", e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    logger.flush();
    return 0;
}
