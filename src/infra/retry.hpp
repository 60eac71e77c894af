#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <utility>

namespace extsort::infra {
/*

auto attempt = infra::with_retry([&]() {
    return adapters::fs::copy_file(src, dst);
}, infra::RetryPolicy{ .max_retries = 5 }, stop_token, src.string());

*/
struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay = std::chrono::milliseconds(500);
    double backoff_factor = 2.0; // exponential backoff

    // Задержка перед повтором номер attempt (с нуля): base_delay * factor^attempt
    [[nodiscard]] auto delay_for(int attempt) const -> std::chrono::milliseconds {
        constexpr double max_delay_ms = 60.0 * 60.0 * 1000.0;
        const double ms = static_cast<double>(base_delay.count())
                        * std::pow(backoff_factor, attempt);
        if (!std::isfinite(ms) || ms > max_delay_ms) {
            return std::chrono::milliseconds(static_cast<long long>(max_delay_ms));
        }
        return std::chrono::milliseconds(static_cast<long long>(ms));
    }
};

// Состояние одного прогона операции: счётчик повторов и следующая задержка.
class RetryState {
public:
    explicit RetryState(const RetryPolicy& policy) : policy_(policy) {}

    [[nodiscard]] auto retries() const -> int { return retries_; }
    [[nodiscard]] auto next_delay() const -> std::chrono::milliseconds {
        return policy_.delay_for(retries_);
    }

    // Повторяем только Locked/TransientIO и только пока не исчерпан лимит
    [[nodiscard]] auto should_retry(const Error& err) const -> bool {
        return err.is_transient() && retries_ < policy_.max_retries;
    }

    void advance() { ++retries_; }

private:
    const RetryPolicy& policy_;
    int retries_ = 0;
};

template<typename R>
struct RetryOutcome {
    R result;
    int retries = 0;
    bool cancelled = false; // остановлено во время ожидания backoff
};

/// Ждёт delay или запроса остановки. Блокирует только вызывающий поток.
/// Возвращает false, если ожидание прервано остановкой.
inline auto interruptible_sleep(std::chrono::milliseconds delay, std::stop_token st) -> bool {
    if (st.stop_requested()) return false;
    if (delay <= std::chrono::milliseconds::zero()) return true;

    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    const bool stopped = cv.wait_for(lock, st, delay, [&st] { return st.stop_requested(); });
    return !stopped;
}

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy,
                              std::stop_token st = {}, std::string_view label = {})
    -> RetryOutcome<decltype(operation())>
{
    using ResultType = decltype(operation());

    RetryState state{policy};
    for (;;) {
        ResultType result = operation();
        if (result.has_value()) {
            return {std::move(result), state.retries(), false};
        }

        const auto& err = result.error();
        if (!state.should_retry(err)) {
            return {std::move(result), state.retries(), false}; // фатальная ошибка или лимит
        }

        const auto delay = state.next_delay();
        spdlog::warn("{}: {} ({}), retry #{} in {} ms",
                     label, err.message, to_string(err.kind()),
                     state.retries() + 1, delay.count());

        if (!interruptible_sleep(delay, st)) {
            return {std::move(result), state.retries(), true};
        }
        state.advance();
    }
}

} // namespace extsort::infra
