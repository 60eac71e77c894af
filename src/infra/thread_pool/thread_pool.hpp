#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace extsort::infra {

// Пул фиксированного размера с ограниченной очередью.
// enqueue() блокирует производителя, пока очередь заполнена,
// поэтому память занята O(потоки + ёмкость очереди), а не O(число задач).
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency(),
                        std::size_t queue_capacity = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    using Task = std::function<void()>;

    // Блокирует, пока в очереди нет места
    void enqueue(Task task);

    // Блокирующее ожидание завершения всех задач
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

private:
    void worker_loop_(std::stop_token st);

    std::vector<std::jthread> workers_;
    std::deque<Task> tasks_;
    std::size_t capacity_;
    std::size_t active_tasks_ = 0;
    bool stop_ = false;

    mutable std::mutex queue_mutex_;
    std::condition_variable_any task_cv_;   // есть задача / остановка
    std::condition_variable_any space_cv_;  // освободилось место в очереди
    std::condition_variable_any idle_cv_;   // всё выполнено
};

// =============== Реализация ===============

inline ThreadPool::ThreadPool(std::size_t nthreads, std::size_t queue_capacity)
    : capacity_(queue_capacity)
{
    if (nthreads == 0) nthreads = 1;
    if (capacity_ == 0) capacity_ = nthreads * 2;

    workers_.reserve(nthreads);
    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    task_cv_.notify_all();
    space_cv_.notify_all();

    // join до разрушения mutex/cv; оставшиеся в очереди задачи будут доработаны
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

inline void ThreadPool::enqueue(Task task) {
    {
        std::unique_lock lock(queue_mutex_);
        space_cv_.wait(lock, [this] { return stop_ || tasks_.size() < capacity_; });
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.push_back(std::move(task));
    }
    task_cv_.notify_one();
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            task_cv_.wait(lock, [this, &st] {
                return !tasks_.empty() || stop_ || st.stop_requested();
            });

            if (tasks_.empty()) {
                break; // остановка и очередь пуста
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_tasks_;
        }
        space_cv_.notify_one();

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Unhandled exception in worker: {}", e.what());
        }

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

} // namespace extsort::infra
