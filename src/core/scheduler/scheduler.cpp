#include "scheduler.hpp"

#include <cerrno>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>

#include "core/copy_task/copy_task.hpp"
#include "infra/interrupt.hpp"

namespace extsort::core {

namespace {

auto dir_identity(const std::filesystem::path& path) -> infra::Result<std::pair<dev_t, ino_t>> {
    struct stat sb;
    if (::stat(path.c_str(), &sb) == -1) {
        return std::unexpected(infra::error_from_errno(
            errno, fmt::format("Cannot stat directory {}", path.string())));
    }
    return std::pair{sb.st_dev, sb.st_ino};
}

} // namespace

auto to_string(RunState state) -> std::string_view {
    switch (state) {
        case RunState::Idle:       return "idle";
        case RunState::Traversing: return "traversing";
        case RunState::Draining:   return "draining";
        case RunState::Done:       return "done";
    }
    return "unknown";
}

Scheduler::Scheduler(const infra::RunConfig& config)
    : config_(config)
    , resolver_(config.destination_root)
{}

void Scheduler::cancel() {
    if (stop_.request_stop()) {
        spdlog::warn("Cancellation requested, finishing copies in progress...");
    }
}

auto Scheduler::cancelled() const -> bool {
    return stop_.stop_requested() || infra::is_interrupted();
}

auto Scheduler::should_stop_() -> bool {
    if (infra::is_interrupted() && !stop_.stop_requested()) {
        cancel();
    }
    return stop_.stop_requested();
}

void Scheduler::set_state_(RunState state) {
    state_.store(state);
    spdlog::debug("Run state: {}", to_string(state));
}

auto Scheduler::run() -> infra::Result<RunSummary>
{
    if (state_.load() != RunState::Idle) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                               "Scheduler can only run once"));
    }

    auto classifier = PathClassifier::create(config_.exclude_globs);
    if (!classifier) {
        return std::unexpected(std::move(classifier.error()));
    }
    classifier_ = std::move(*classifier);

    std::error_code ec;
    std::filesystem::create_directories(config_.destination_root, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
            fmt::format("Cannot create destination {}: {}",
                        config_.destination_root.string(), ec.message())));
    }
    if (auto id = dir_identity(config_.destination_root)) {
        destination_id_ = *id;
    }

    spdlog::info("Source: {}", config_.source_root.string());
    spdlog::info("Destination: {}", config_.destination_root.string());
    spdlog::debug("Concurrency: {}, retries: {}, retry delay: {} ms, exclusions: {}",
                  config_.max_concurrency, config_.max_retries,
                  config_.retry_base_delay.count(), config_.exclude_globs.size());

    set_state_(RunState::Traversing);
    {
        infra::ThreadPool pool{config_.max_concurrency, config_.max_concurrency * 2u};
        traverse_(pool);

        set_state_(RunState::Draining);
        pool.wait();
    }
    set_state_(RunState::Done);

    auto summary = report_.summary();
    if (summary.total == 0) {
        spdlog::info("No files found in {}", config_.source_root.string());
    }
    return summary;
}

void Scheduler::traverse_(infra::ThreadPool& pool)
{
    const auto& root = config_.source_root;
    if (auto id = dir_identity(root)) {
        visited_.insert(*id);
    }

    // Явный стек вместо рекурсии: глубина дерева не ограничена стеком потока
    std::vector<std::filesystem::path> pending{root};

    while (!pending.empty() && !should_stop_()) {
        const auto dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        std::filesystem::directory_iterator it{dir, ec};
        if (ec) {
            record_traversal_error_(dir, ec);
            continue;
        }

        for (const std::filesystem::directory_iterator end; it != end; ) {
            if (should_stop_()) break;

            visit_entry_(*it, pending, pool);

            it.increment(ec);
            if (ec) {
                record_traversal_error_(dir, ec);
                break;
            }
        }
    }
}

void Scheduler::visit_entry_(const std::filesystem::directory_entry& entry,
                             std::vector<std::filesystem::path>& pending,
                             infra::ThreadPool& pool)
{
    const auto& path = entry.path();
    const auto relative = path.lexically_relative(config_.source_root);

    std::error_code ec;
    const auto status = entry.status(ec); // следует за symlink
    if (ec || status.type() == std::filesystem::file_type::not_found) {
        std::error_code link_ec;
        if (entry.is_symlink(link_ec)) {
            spdlog::warn("Ignoring dangling symlink {}", relative.string());
            return;
        }
        if (!ec) {
            spdlog::debug("Entry vanished during traversal: {}", relative.string());
            return;
        }
        record_traversal_error_(path, ec);
        return;
    }

    const bool is_dir = std::filesystem::is_directory(status);
    const bool is_file = std::filesystem::is_regular_file(status);
    if (!is_dir && !is_file) {
        spdlog::debug("Ignoring special file {}", relative.string());
        return;
    }

    if (auto pattern = classifier_.matching_pattern(relative, is_dir)) {
        spdlog::debug("Excluded by glob '{}': {}", *pattern, relative.string());
        report_.add(Skipped{path, SkipReason::Excluded});
        return;
    }

    if (is_dir) {
        auto id = dir_identity(path);
        if (!id) {
            const auto err = infra::log_and_return(std::move(id.error()));
            report_.add(Failed{path, err.code, 0, err.message});
            return;
        }
        if (destination_id_ && *id == *destination_id_) {
            spdlog::info("Skipping destination directory inside source: {}", relative.string());
            return;
        }
        if (!visited_.insert(*id).second) {
            spdlog::debug("Directory already visited (symlink loop?): {}", relative.string());
            return;
        }
        pending.push_back(path);
        return;
    }

    std::optional<std::uintmax_t> size;
    if (const auto sz = entry.file_size(ec); !ec) {
        size = sz;
    }
    dispatch_(pool, FileEntry{path, relative, size});
}

void Scheduler::dispatch_(infra::ThreadPool& pool, FileEntry entry)
{
    // Блокируется, пока очередь пула заполнена
    pool.enqueue([this, entry = std::move(entry)]() mutable {
        if (should_stop_()) {
            report_.add(Skipped{entry.source, SkipReason::Cancelled});
            return;
        }
        CopyTask task{std::move(entry), config_, resolver_};
        report_.add(task.run(stop_.get_token()));
    });
}

void Scheduler::record_traversal_error_(const std::filesystem::path& path, const std::error_code& ec)
{
    const auto err = infra::log_and_return(infra::error_from_errno(ec.value(),
        fmt::format("Cannot read {}", path.string())));
    report_.add(Failed{path, err.code, 0, err.message});
}

} // namespace extsort::core
