#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "core/outcome/outcome.hpp"

namespace extsort::core {

struct FailureRecord {
    std::filesystem::path path;
    infra::ErrorCode code = infra::ErrorCode::Unknown;
    infra::ErrorKind kind = infra::ErrorKind::Fatal;
    int retries = 0;
    std::string message;
};

// Итог прогона. Снимок, после Done не меняется.
struct RunSummary {
    std::uint64_t total = 0;
    std::uint64_t copied = 0;
    std::uint64_t bytes_copied = 0;
    std::uint64_t skipped_locked = 0;
    std::uint64_t skipped_excluded = 0;
    std::uint64_t skipped_cancelled = 0;
    std::uint64_t failed = 0;
    std::uint64_t retries = 0;
    std::vector<FailureRecord> failures;

    [[nodiscard]] auto skipped() const -> std::uint64_t {
        return skipped_locked + skipped_excluded + skipped_cancelled;
    }
    [[nodiscard]] auto ok() const -> bool { return failed == 0; }
};

// Собирает исходы из рабочих потоков; порядок поступления не важен.
class ReportAggregator {
public:
    ReportAggregator() = default;

    ReportAggregator(const ReportAggregator&) = delete;
    ReportAggregator& operator=(const ReportAggregator&) = delete;

    void add(const CopyOutcome& outcome);

    [[nodiscard]] auto summary() const -> RunSummary;

private:
    std::atomic<std::uint64_t> total_{0};
    std::atomic<std::uint64_t> copied_{0};
    std::atomic<std::uint64_t> bytes_copied_{0};
    std::atomic<std::uint64_t> skipped_locked_{0};
    std::atomic<std::uint64_t> skipped_excluded_{0};
    std::atomic<std::uint64_t> skipped_cancelled_{0};
    std::atomic<std::uint64_t> retries_{0};

    mutable std::mutex failures_mutex_;
    std::vector<FailureRecord> failures_;
};

// Печатает итог через spdlog: счётчики, затем по строке на каждую ошибку
void log_summary(const RunSummary& summary, std::chrono::milliseconds elapsed);

} // namespace extsort::core
