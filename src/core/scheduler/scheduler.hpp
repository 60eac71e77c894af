#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <set>
#include <system_error>
#include <vector>
#include <stop_token>
#include <string_view>
#include <utility>
#include <sys/types.h>
#include "core/collision_resolver/collision_resolver.hpp"
#include "core/outcome/outcome.hpp"
#include "core/path_classifier/path_classifier.hpp"
#include "core/report/report.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/thread_pool/thread_pool.hpp"

namespace extsort::core {

enum class RunState {
    Idle,
    Traversing,
    Draining,
    Done,
};

[[nodiscard]] auto to_string(RunState state) -> std::string_view;

/// Обходит дерево источника и раздаёт файлы пулу из max_concurrency потоков.
///
/// Обход идёт в вызывающем потоке параллельно с копированием; очередь пула
/// ограничена, поэтому обход не убегает вперёд больше чем на пару задач на поток.
/// Исключённые каталоги не обходятся. Каталоги, достижимые по symlink,
/// посещаются один раз (по паре device/inode).
class Scheduler {
public:
    explicit Scheduler(const infra::RunConfig& config);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Выполняет прогон целиком: Idle -> Traversing -> Draining -> Done.
    /// Ошибка возвращается только если прогон не удалось начать
    /// (некорректный шаблон исключения, не создаётся папка назначения).
    [[nodiscard]] auto run() -> infra::Result<RunSummary>;

    // Можно вызывать из любого потока
    void cancel();

    [[nodiscard]] auto cancelled() const -> bool;

    [[nodiscard]] auto state() const -> RunState { return state_.load(); }

private:
    // Переносит SIGINT/SIGTERM в stop_, чтобы прервать ожидания backoff
    auto should_stop_() -> bool;

    using DirId = std::pair<dev_t, ino_t>;

    void set_state_(RunState state);

    void traverse_(infra::ThreadPool& pool);
    void visit_entry_(const std::filesystem::directory_entry& entry,
                      std::vector<std::filesystem::path>& pending,
                      infra::ThreadPool& pool);
    void dispatch_(infra::ThreadPool& pool, FileEntry entry);
    void record_traversal_error_(const std::filesystem::path& path, const std::error_code& ec);

    const infra::RunConfig& config_;
    PathClassifier classifier_;
    CollisionResolver resolver_;
    ReportAggregator report_;

    std::stop_source stop_;
    std::atomic<RunState> state_{RunState::Idle};

    // Используются только потоком обхода
    std::set<DirId> visited_;
    std::optional<DirId> destination_id_;
};

} // namespace extsort::core
