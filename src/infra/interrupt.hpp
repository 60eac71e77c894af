#pragma once

#include <atomic>
#include <csignal>

namespace extsort::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM только выставляют флаг; Scheduler опрашивает его и отменяет прогон
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace extsort::infra
