#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>
#include <spdlog/common.h>
#include "../error_handler/error.hpp"
#include "../retry.hpp"

namespace extsort::args_parser {
    struct CLIArgs;
}

namespace extsort::infra {

inline constexpr std::uint32_t kDefaultConcurrency = 8;
inline constexpr std::uint32_t kDefaultRetries = 3;
inline constexpr double kDefaultRetryDelaySec = 0.5;

// Один слой настроек (файл или CLI). Пустые поля не переопределяют другой слой.
struct Config {
    std::optional<std::uint32_t> concurrency;
    std::optional<std::uint32_t> retries;
    std::optional<double> retry_delay;          // секунды

    bool skip_locked = false;
    bool silent_locked = false;
    bool quiet = false;

    std::optional<std::string> log_level;
    std::vector<std::string> exclude_patterns;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

// Итоговые параметры прогона. Создаётся один раз до обхода и дальше только читается.
struct RunConfig {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    std::uint32_t max_concurrency = kDefaultConcurrency;
    std::uint32_t max_retries = kDefaultRetries;
    std::chrono::milliseconds retry_base_delay{500};
    bool skip_locked = false;
    bool silent_locked = false;
    std::vector<std::string> exclude_globs;

    [[nodiscard]] auto retry_policy() const -> RetryPolicy {
        return RetryPolicy{
            .max_retries = static_cast<int>(max_retries),
            .base_delay = retry_base_delay,
            .backoff_factor = 2.0,
        };
    }
};

/// Загружает конфигурацию из файла YAML.
/// Если explicit_path задан, файл обязан существовать.
/// Иначе ищет файл в порядке:
///   1. ./.extsort.yaml
///   2. $XDG_CONFIG_HOME/extsort/config.yaml или ~/.config/extsort/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file(
    const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

/// Проверяет слой настроек и пути, собирает RunConfig.
/// Любая ошибка возвращается как ErrorCode::ConfigError.
[[nodiscard]] auto make_run_config(const Config& config,
                                   const std::filesystem::path& source,
                                   const std::filesystem::path& destination)
    -> Result<RunConfig>;

// "debug", "info", "warning"/"warn", "error"
[[nodiscard]] auto parse_log_level(std::string_view name)
    -> std::optional<spdlog::level::level_enum>;

} // namespace extsort::infra
