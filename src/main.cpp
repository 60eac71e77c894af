#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/retry.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/report/report.hpp"
#include "core/scheduler/scheduler.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>

using GIT = extsort::build_info::GitInfo;
using RUN_CONFIG = extsort::infra::RunConfig;

constexpr auto load_from_cli = extsort::infra::config_from_cli;
constexpr auto args_parser = extsort::args_parser::parse_args;
constexpr auto git = extsort::build_info::get_git_info();

constexpr int kExitOk = 0;
constexpr int kExitFailures = 1;
constexpr int kExitConfig = 2;
constexpr int kExitInterrupted = 130;

static auto
out_git_verse(const GIT& git)
-> void {
    spdlog::debug("Git branch: {}", git.branch);
    spdlog::debug("Git commit: {}{}", git.commit, git.dirty ? " (dirty)" : "");
    spdlog::debug("Build timestamp (UTC): {}", git.timestamp);
}

static auto
out_config_verse(const RUN_CONFIG& config)
-> void {
    spdlog::info("Concurrency: {}", config.max_concurrency);
    spdlog::info("Retries: {} (base delay {} ms)", config.max_retries, config.retry_base_delay.count());
    spdlog::info("Skip locked: {}{}", config.skip_locked ? "yes" : "no",
                 config.silent_locked ? " (silent)" : "");
    for (const auto& glob : config.exclude_globs) {
        spdlog::info("Exclude: {}", glob);
    }
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        extsort::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return args_opt.error(); // --help, --version или ошибка разбора
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = extsort::infra::load_config_from_file(
            args.config_file ? std::optional<std::filesystem::path>{*args.config_file} : std::nullopt);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return kExitConfig;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        auto level = extsort::infra::parse_log_level(config.log_level.value_or("info"));
        if (!level) {
            spdlog::error("Config error: unknown log level '{}'", *config.log_level);
            return kExitConfig;
        }
        if (config.quiet) {
            level = std::max(*level, spdlog::level::warn);
        }
        spdlog::set_level(*level);

        auto run_config = extsort::infra::make_run_config(config, args.source, args.destination);
        if (!run_config) {
            spdlog::error("Config error: {}", run_config.error().message);
            return kExitConfig;
        }

        out_git_verse(git);
        out_config_verse(*run_config);

        extsort::core::Scheduler scheduler{*run_config};

        // Сигнал только выставляет флаг; этот поток переводит его в отмену прогона
        std::jthread interrupt_watcher([&scheduler](std::stop_token st) {
            while (extsort::infra::interruptible_sleep(std::chrono::milliseconds(100), st)) {
                if (extsort::infra::is_interrupted()) {
                    scheduler.cancel();
                    return;
                }
            }
        });

        auto start_time = std::chrono::steady_clock::now();
        auto result = scheduler.run();
        auto end_time = std::chrono::steady_clock::now();

        interrupt_watcher.request_stop();

        if (!result) {
            spdlog::error("Copy operation failed: {}", result.error().message);
            return result.error().to_exit_code();
        }

        const auto& summary = *result;
        extsort::core::log_summary(summary,
            std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time));

        if (scheduler.cancelled()) {
            return kExitInterrupted;
        }
        return summary.ok() ? kExitOk : kExitFailures;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitFailures;
    }
}
