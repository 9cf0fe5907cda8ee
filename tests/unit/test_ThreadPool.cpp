#include <gtest/gtest.h>
#include "concurrency/ThreadPool.hpp"
#include "upload/model/Outcome.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace lb::concurrency;
using lb::upload::model::Outcome;

namespace {

struct FnTask final : PromisedTask {
    std::function<Outcome()> fn;
    explicit FnTask(std::function<Outcome()> f) : fn(std::move(f)) {}
    void operator()() override { promise.set_value(fn()); }
};

struct ThrowingTask final : Task {
    void operator()() override { throw std::runtime_error("boom"); }
};

struct NonStandardThrowingTask final : Task {
    void operator()() override { throw 42; }
};

}

TEST(ThreadPoolTest, RejectsZeroWorkers) {
    EXPECT_THROW(ThreadPool(0), std::invalid_argument);
}

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    ThreadPool pool(3);
    std::atomic<int> ran{0};
    std::vector<std::future<Outcome>> futures;

    for (int i = 0; i < 20; ++i) {
        auto task = std::make_shared<FnTask>([&] { ++ran; return Outcome::Uploaded; });
        futures.push_back(task->getFuture().value());
        pool.submit(task);
    }

    pool.drain();
    EXPECT_EQ(ran.load(), 20);
    for (auto& f : futures) EXPECT_EQ(f.get(), Outcome::Uploaded);
    EXPECT_EQ(pool.inFlight(), 0u);
}

TEST(ThreadPoolTest, NeverRunsMoreThanCapacity) {
    ThreadPool pool(2);
    std::atomic<int> current{0}, peak{0};

    for (int i = 0; i < 12; ++i) {
        pool.submit(std::make_shared<FnTask>([&] {
            const int now = ++current;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --current;
            return Outcome::Uploaded;
        }));
        EXPECT_LE(pool.inFlight(), 2u);
    }

    pool.drain();
    EXPECT_LE(peak.load(), 2);
}

TEST(ThreadPoolTest, DroppedSlotIsReturned) {
    ThreadPool pool(1);
    {
        auto slot = pool.acquire();
        EXPECT_EQ(pool.inFlight(), 1u);
    }
    EXPECT_EQ(pool.inFlight(), 0u);

    // Would block forever if the slot leaked
    auto again = pool.acquire();
    EXPECT_EQ(pool.inFlight(), 1u);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotLeakSlotOrKillWorker) {
    ThreadPool pool(1);
    pool.submit(std::make_shared<ThrowingTask>());
    pool.drain();
    EXPECT_EQ(pool.inFlight(), 0u);

    auto task = std::make_shared<FnTask>([] { return Outcome::Skipped; });
    auto future = task->getFuture().value();
    pool.submit(task);
    EXPECT_EQ(future.get(), Outcome::Skipped);
}

TEST(ThreadPoolTest, NonStandardExceptionDoesNotKillWorker) {
    ThreadPool pool(1);
    pool.submit(std::make_shared<NonStandardThrowingTask>());
    pool.drain();
    EXPECT_EQ(pool.inFlight(), 0u);

    auto task = std::make_shared<FnTask>([] { return Outcome::Uploaded; });
    auto future = task->getFuture().value();
    pool.submit(task);
    EXPECT_EQ(future.get(), Outcome::Uploaded);
}

TEST(ThreadPoolTest, StopWaitsForRunningTask) {
    ThreadPool pool(1);
    std::promise<void> started;
    std::atomic<bool> release{false};
    std::atomic<int> ran{0};

    pool.submit(std::make_shared<FnTask>([&] {
        started.set_value();
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        ++ran;
        return Outcome::Uploaded;
    }));
    started.get_future().wait();

    std::thread stopper([&] { pool.stop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    release = true;
    stopper.join();

    EXPECT_EQ(ran.load(), 1);
    EXPECT_EQ(pool.inFlight(), 0u);
    EXPECT_THROW((void)pool.acquire(), std::runtime_error);
}

TEST(ThreadPoolTest, SlotFromAnotherPoolIsRejected) {
    ThreadPool a(1), b(1);
    auto slot = a.acquire();
    EXPECT_THROW(b.submit(std::move(slot), std::make_shared<FnTask>([] { return Outcome::Uploaded; })),
                 std::invalid_argument);
    EXPECT_EQ(a.inFlight(), 0u);
}
