#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <expected>

namespace extsort::args_parser {

struct CLIArgs
{
    std::string source;                         // SOURCE или -s, --source
    std::string destination;                    // DESTINATION или -d, --destination
    std::optional<std::uint32_t> concurrency;   // -j, --concurrency, --max-workers
    std::optional<std::uint32_t> retries;       // --retries
    std::optional<double> retry_delay;          // --retry-delay (секунды)
    bool skip_locked{false};                    // --skip-locked
    bool silent_locked{false};                  // --silent-locked
    bool quiet{false};                          // -q, --quiet
    std::vector<std::string> exclude_globs;     // -x, --exclude-glob (повторяемый)
    std::optional<std::string> log_level;       // --log-level
    std::optional<std::string> config_file;     // -c, --config
};

/// Parses command-line arguments.
/// On --help/--version or a parse error returns the process exit code instead
/// (0 for help/version, 2 for invalid usage).
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace extsort::args_parser
