#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace extsort::infra {

namespace {

constexpr std::uint32_t kMaxConcurrency = 1024;
constexpr std::uint32_t kMaxRetries = 100;
constexpr double kMaxRetryDelaySec = 3600.0;

auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.push_back(".extsort.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && *config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "extsort" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "extsort" / "config.yaml");
        }
    }

    return paths;
}

auto parse_config_file(const std::filesystem::path& path) -> std::expected<Config, std::string> {
    try {
        YAML::Node node = YAML::LoadFile(path.string());
        Config cfg{};

        if (!node || node.IsNull()) {
            return cfg; // пустой файл
        }
        if (!node.IsMap()) {
            return std::unexpected(fmt::format("Failed to parse {}: top level must be a mapping",
                                               path.string()));
        }

        if (node["concurrency"]) cfg.concurrency = node["concurrency"].as<std::uint32_t>();
        if (node["retries"]) cfg.retries = node["retries"].as<std::uint32_t>();
        if (node["retry_delay"]) cfg.retry_delay = node["retry_delay"].as<double>();

        if (node["skip_locked"]) cfg.skip_locked = node["skip_locked"].as<bool>();
        if (node["silent_locked"]) cfg.silent_locked = node["silent_locked"].as<bool>();
        if (node["quiet"]) cfg.quiet = node["quiet"].as<bool>();
        if (node["log_level"]) cfg.log_level = node["log_level"].as<std::string>();

        if (node["exclude"]) {
            for (const auto& pat : node["exclude"]) {
                cfg.exclude_patterns.push_back(pat.as<std::string>());
            }
        }

        spdlog::debug("Loaded config from {}", path.string());
        return cfg;

    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

auto config_error(std::string_view message) -> Error {
    return make_error(ErrorCode::ConfigError, message);
}

} // namespace

void Config::merge_with(const Config& other) {
    if (other.concurrency) concurrency = other.concurrency;
    if (other.retries) retries = other.retries;
    if (other.retry_delay) retry_delay = other.retry_delay;
    if (other.skip_locked) skip_locked = true;
    if (other.silent_locked) silent_locked = true;
    if (other.quiet) quiet = true;
    if (other.log_level) log_level = other.log_level;

    // Исключения из обоих слоёв складываются
    exclude_patterns.insert(exclude_patterns.end(),
                            other.exclude_patterns.begin(), other.exclude_patterns.end());
}

auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path)
    -> std::expected<Config, std::string>
{
    if (explicit_path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*explicit_path, ec)) {
            return std::unexpected(fmt::format("Config file not found: {}", explicit_path->string()));
        }
        return parse_config_file(*explicit_path);
    }

    for (const auto& path : get_config_paths()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;
        return parse_config_file(path);
    }

    // Файл не найден: пустой конфиг, не ошибка
    return Config{};
}

auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
    Config cfg{};
    cfg.concurrency = args.concurrency;
    cfg.retries = args.retries;
    cfg.retry_delay = args.retry_delay;
    cfg.skip_locked = args.skip_locked;
    cfg.silent_locked = args.silent_locked;
    cfg.quiet = args.quiet;
    cfg.log_level = args.log_level;
    cfg.exclude_patterns = args.exclude_globs;
    return cfg;
}

auto make_run_config(const Config& config,
                     const std::filesystem::path& source,
                     const std::filesystem::path& destination) -> Result<RunConfig>
{
    if (source.empty()) {
        return std::unexpected(config_error("Source directory is required"));
    }
    if (destination.empty()) {
        return std::unexpected(config_error("Destination directory is required"));
    }

    std::error_code ec;
    const auto source_root = std::filesystem::absolute(source, ec).lexically_normal();
    if (ec) {
        return std::unexpected(config_error(fmt::format("Invalid source path {}: {}",
                                                        source.string(), ec.message())));
    }
    if (!std::filesystem::is_directory(source_root, ec)) {
        return std::unexpected(config_error(fmt::format(
            "Source does not exist or is not a directory: {}", source_root.string())));
    }

    const auto destination_root = std::filesystem::absolute(destination, ec).lexically_normal();
    if (ec) {
        return std::unexpected(config_error(fmt::format("Invalid destination path {}: {}",
                                                        destination.string(), ec.message())));
    }
    if (std::filesystem::exists(destination_root, ec) &&
        !std::filesystem::is_directory(destination_root, ec)) {
        return std::unexpected(config_error(fmt::format(
            "Destination exists and is not a directory: {}", destination_root.string())));
    }
    if (std::filesystem::exists(destination_root, ec) &&
        std::filesystem::equivalent(source_root, destination_root, ec)) {
        return std::unexpected(config_error("Source and destination are the same directory"));
    }

    const auto concurrency = config.concurrency.value_or(kDefaultConcurrency);
    if (concurrency < 1 || concurrency > kMaxConcurrency) {
        return std::unexpected(config_error(fmt::format(
            "Concurrency must be in [1, {}], got {}", kMaxConcurrency, concurrency)));
    }

    const auto retries = config.retries.value_or(kDefaultRetries);
    if (retries > kMaxRetries) {
        return std::unexpected(config_error(fmt::format(
            "Retries must be in [0, {}], got {}", kMaxRetries, retries)));
    }

    const double delay = config.retry_delay.value_or(kDefaultRetryDelaySec);
    if (!std::isfinite(delay) || delay < 0.0 || delay > kMaxRetryDelaySec) {
        return std::unexpected(config_error(fmt::format(
            "Retry delay must be in [0, {}] seconds, got {}", kMaxRetryDelaySec, delay)));
    }

    return RunConfig{
        .source_root = source_root,
        .destination_root = destination_root,
        .max_concurrency = concurrency,
        .max_retries = retries,
        .retry_base_delay = std::chrono::milliseconds(std::llround(delay * 1000.0)),
        .skip_locked = config.skip_locked,
        .silent_locked = config.silent_locked,
        .exclude_globs = config.exclude_patterns,
    };
}

auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warning" || lower == "warn") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    return std::nullopt;
}

} // namespace extsort::infra
