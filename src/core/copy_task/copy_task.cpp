#include "copy_task.hpp"

#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"
#include "core/path_classifier/path_classifier.hpp"
#include "infra/retry.hpp"

namespace extsort::core {

namespace {
// Сколько раз выбираем новое имя, если файл назначения появился извне после резерва
constexpr int kMaxCollisionAttempts = 50;
}

CopyTask::CopyTask(FileEntry entry, const infra::RunConfig& config, CollisionResolver& resolver)
    : entry_(std::move(entry)), config_(config), resolver_(resolver) {}

auto CopyTask::run(std::stop_token st) -> CopyOutcome
{
    if (st.stop_requested()) {
        return Skipped{entry_.source, SkipReason::Cancelled};
    }

    const auto bucket = classify_bucket(entry_.source);
    const auto name = entry_.source.filename().string();
    const auto policy = config_.retry_policy();
    const auto label = entry_.relative.string();

    int total_retries = 0;
    for (int attempt = 0; attempt < kMaxCollisionAttempts; ++attempt) {
        auto reservation = resolver_.reserve(bucket, name);
        if (!reservation) {
            spdlog::error("Cannot reserve destination for {}: {}", label, reservation.error().message);
            return Failed{entry_.source, reservation.error().code, total_retries,
                          reservation.error().message};
        }

        const auto& dst = reservation->path();
        auto attempted = infra::with_retry([&]() {
            return adapters::fs::copy_file(entry_.source, dst);
        }, policy, st, label);
        total_retries += attempted.retries;

        if (attempted.result) {
            if (auto meta = adapters::fs::copy_metadata(entry_.source, dst); !meta) {
                spdlog::warn("Failed to copy metadata for {}: {}", label, meta.error().message);
            }
            reservation->commit();
            spdlog::debug("Copied {} -> {}/{}", label, bucket, reservation->filename());
            return Copied{entry_.source, dst, *attempted.result, total_retries};
        }

        const auto& err = attempted.result.error();
        if (err.code == infra::ErrorCode::AlreadyExists && !attempted.cancelled) {
            // Имя заняли в обход резерва; reservation освободится, выбираем следующее
            spdlog::debug("{} appeared on disk, resolving a new name for {}", dst.string(), label);
            continue;
        }
        return on_error_(err, total_retries, attempted.cancelled);
    }

    spdlog::error("Giving up on {}: destination names keep appearing concurrently", label);
    return Failed{entry_.source, infra::ErrorCode::AlreadyExists, total_retries,
                  "No stable destination name after repeated collisions"};
}

auto CopyTask::on_error_(const infra::Error& err, int retries, bool cancelled) const
    -> CopyOutcome
{
    const auto label = entry_.relative.string();

    if (cancelled) {
        spdlog::debug("Cancelled while waiting to retry {}", label);
        return Skipped{entry_.source, SkipReason::Cancelled};
    }

    if (err.is_locked() && config_.skip_locked) {
        if (config_.silent_locked) {
            spdlog::debug("Skipping locked file {} after {} retries", label, retries);
        } else {
            spdlog::warn("Skipping locked file {} after {} retries", label, retries);
        }
        return Skipped{entry_.source, SkipReason::Locked};
    }

    spdlog::error("Failed to copy {} after {} retries: {} ({})",
                  label, retries, err.message, infra::to_string(err.kind()));
    return Failed{entry_.source, err.code, retries, err.message};
}

} // namespace extsort::core
