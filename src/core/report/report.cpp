#include "report.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace extsort::core {

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

void ReportAggregator::add(const CopyOutcome& outcome) {
    total_.fetch_add(1, std::memory_order_relaxed);

    std::visit(overloaded{
        [this](const Copied& c) {
            copied_.fetch_add(1, std::memory_order_relaxed);
            bytes_copied_.fetch_add(c.bytes, std::memory_order_relaxed);
            retries_.fetch_add(static_cast<std::uint64_t>(c.retries), std::memory_order_relaxed);
        },
        [this](const Skipped& s) {
            switch (s.reason) {
                case SkipReason::Locked:
                    skipped_locked_.fetch_add(1, std::memory_order_relaxed);
                    break;
                case SkipReason::Excluded:
                    skipped_excluded_.fetch_add(1, std::memory_order_relaxed);
                    break;
                case SkipReason::Cancelled:
                    skipped_cancelled_.fetch_add(1, std::memory_order_relaxed);
                    break;
            }
        },
        [this](const Failed& f) {
            retries_.fetch_add(static_cast<std::uint64_t>(f.retries), std::memory_order_relaxed);
            std::lock_guard lock(failures_mutex_);
            failures_.push_back(FailureRecord{
                .path = f.source,
                .code = f.code,
                .kind = f.kind(),
                .retries = f.retries,
                .message = f.message,
            });
        },
    }, outcome);
}

auto ReportAggregator::summary() const -> RunSummary {
    RunSummary s{
        .total = total_.load(),
        .copied = copied_.load(),
        .bytes_copied = bytes_copied_.load(),
        .skipped_locked = skipped_locked_.load(),
        .skipped_excluded = skipped_excluded_.load(),
        .skipped_cancelled = skipped_cancelled_.load(),
        .failed = 0,
        .retries = retries_.load(),
        .failures = {},
    };
    {
        std::lock_guard lock(failures_mutex_);
        s.failures = failures_;
    }
    s.failed = s.failures.size();
    return s;
}

void log_summary(const RunSummary& summary, std::chrono::milliseconds elapsed) {
    const auto level = summary.ok() ? spdlog::level::info : spdlog::level::warn;

    spdlog::log(level, "Done: copied={}, skipped={} (locked={}, excluded={}, cancelled={}), failed={}",
                summary.copied, summary.skipped(),
                summary.skipped_locked, summary.skipped_excluded, summary.skipped_cancelled,
                summary.failed);
    spdlog::info("Bytes copied: {} ({:.2f} MB), retries: {}, time elapsed: {:.2f} seconds",
                 summary.bytes_copied,
                 summary.bytes_copied / 1024.0 / 1024.0,
                 summary.retries,
                 elapsed.count() / 1000.0);

    for (const auto& f : summary.failures) {
        spdlog::error("  {} [{} / {}] retries={}: {}",
                      f.path.string(), infra::to_string(f.kind), infra::to_string(f.code),
                      f.retries, f.message);
    }
}

} // namespace extsort::core
