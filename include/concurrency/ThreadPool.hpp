#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lb::concurrency {

// Fixed-size worker pool with admission control: at most one task per worker is queued or running
// at any time. Callers first acquire a Slot (blocks while the pool is saturated), then hand the
// slot over together with the task. A slot is returned to the pool when the task finishes, when it
// is discarded by stop(), or when the Slot is dropped without being submitted.
class ThreadPool {
public:
    class Slot {
    public:
        Slot(Slot&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot();

    private:
        friend class ThreadPool;
        explicit Slot(ThreadPool* pool) : pool_(pool) {}
        ThreadPool* pool_;
    };

    explicit ThreadPool(unsigned int nThreads);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    [[nodiscard]] Slot acquire();

    void submit(Slot slot, std::shared_ptr<Task> task);
    void submit(std::shared_ptr<Task> task) { submit(acquire(), std::move(task)); }

    // Blocks until nothing is queued or running.
    void drain();

    // Discards queued tasks and joins the workers once their current task returns.
    void stop();

    [[nodiscard]] size_t inFlight() const;

private:
    struct Entry {
        Slot slot;
        std::shared_ptr<Task> task;
    };

    void spawnWorker();
    void release();

    std::vector<std::thread> threads_;
    const unsigned int capacity_;
    size_t committed_{0};   // queued + running, guarded by mutex

    std::condition_variable cv;       // work available or stopping
    std::condition_variable slotCv;   // a slot was released
    mutable std::mutex mutex;
    std::queue<Entry> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace lb::concurrency
