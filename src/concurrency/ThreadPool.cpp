#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <optional>
#include <stdexcept>

using namespace lb::concurrency;

ThreadPool::Slot& ThreadPool::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        if (pool_) pool_->release();
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

ThreadPool::Slot::~Slot() {
    if (pool_) pool_->release();
}

ThreadPool::ThreadPool(const unsigned int nThreads) : capacity_(nThreads) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool needs at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

ThreadPool::Slot ThreadPool::acquire() {
    std::unique_lock lock(mutex);
    slotCv.wait(lock, [this] { return stopFlag.load() || committed_ < capacity_; });
    if (stopFlag.load()) throw std::runtime_error("Cannot acquire a slot from a stopped ThreadPool");
    ++committed_;
    return Slot(this);
}

void ThreadPool::submit(Slot slot, std::shared_ptr<Task> task) {
    if (slot.pool_ != this) throw std::invalid_argument("Slot was not acquired from this ThreadPool");
    if (!task) throw std::invalid_argument("Cannot submit an empty task");
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("Cannot submit to a stopped ThreadPool");
        queue.push(Entry{std::move(slot), std::move(task)});
    }
    cv.notify_one();
}

void ThreadPool::drain() {
    std::unique_lock lock(mutex);
    slotCv.wait(lock, [this] { return committed_ == 0; });
}

void ThreadPool::stop() {
    std::queue<Entry> discarded;
    {
        std::scoped_lock lock(mutex);
        stopFlag.store(true);
        std::swap(queue, discarded);
    }

    // Slots of discarded entries go back outside the lock
    while (!discarded.empty()) discarded.pop();

    cv.notify_all();
    slotCv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    std::scoped_lock lock(mutex);
    threads_.clear();
}

size_t ThreadPool::inFlight() const {
    std::scoped_lock lock(mutex);
    return committed_;
}

void ThreadPool::release() {
    {
        std::scoped_lock lock(mutex);
        --committed_;
    }
    slotCv.notify_all();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::optional<Entry> entry;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                entry.emplace(std::move(queue.front()));
                queue.pop();
            }

            try {
                (*entry->task)();
            } catch (const std::exception& e) {
                log::Registry::upload()->error("[ThreadPool] Task failed: {}", e.what());
            } catch (...) {
                log::Registry::upload()->error("[ThreadPool] Task failed with a non-standard exception");
            }

            entry.reset();
        }
    });
}
