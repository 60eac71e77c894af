#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace extsort::args_parser {

namespace {

constexpr int kUsageExitCode = 2;

auto version_string() -> std::string {
    const auto git = build_info::get_git_info();
    return fmt::format("extsort {} ({}{}, built {})",
                       git.branch, git.commit_short, git.dirty ? "-dirty" : "", git.timestamp);
}

} // namespace

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>
{
    CLIArgs args;
    std::string positional_source;
    std::string positional_destination;

    CLI::App app{"Copy every file of a directory tree into per-extension folders", "extsort"};
    app.set_version_flag("--version", version_string());

    auto* pos_src = app.add_option("SOURCE", positional_source, "Directory to scan");
    auto* pos_dst = app.add_option("DESTINATION", positional_destination,
                                   "Directory to write extension folders into (created if absent)");
    auto* opt_src = app.add_option("-s,--source", args.source, "Directory to scan");
    auto* opt_dst = app.add_option("-d,--destination", args.destination,
                                   "Directory to write extension folders into (created if absent)");
    pos_src->excludes(opt_src);
    pos_dst->excludes(opt_dst);

    app.add_option("-j,--concurrency,--max-workers", args.concurrency,
                   "Maximum number of simultaneous copies (default 8)");
    app.add_option("--retries", args.retries,
                   "Retry attempts for locked or transient errors (default 3)");
    app.add_option("--retry-delay", args.retry_delay,
                   "Base backoff delay in seconds, doubled on each retry (default 0.5)");
    app.add_flag("--skip-locked", args.skip_locked,
                 "Report files still locked after all retries as skipped instead of failed");
    app.add_flag("--silent-locked", args.silent_locked,
                 "Do not warn about skipped locked files");
    app.add_option("-x,--exclude-glob", args.exclude_globs,
                   "Glob of source paths to prune (repeatable), e.g. 'tmp/**' or '*/Unity/*'")
        ->allow_extra_args(false);
    app.add_option("--log-level", args.log_level, "debug, info, warning or error (default info)");
    app.add_option("-c,--config", args.config_file, "YAML config file");
    app.add_flag("-q,--quiet", args.quiet, "Only print warnings, errors and failures");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        return std::unexpected(code == 0 ? 0 : kUsageExitCode);
    }

    if (args.source.empty()) args.source = positional_source;
    if (args.destination.empty()) args.destination = positional_destination;

    if (args.source.empty() || args.destination.empty()) {
        fmt::print(stderr, "Both SOURCE and DESTINATION are required\nRun with --help for more information.\n");
        return std::unexpected(kUsageExitCode);
    }

    return args;
}

} // namespace extsort::args_parser
