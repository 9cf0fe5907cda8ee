#pragma once

#include "concurrency/ThreadPool.hpp"
#include "upload/model/Outcome.hpp"
#include "upload/model/RunOptions.hpp"
#include "upload/model/RunResult.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <vector>

namespace lb::remote { class Client; }

namespace lb::upload {

class RunState;
class Uploader;

// Drives one upload run: Idle -> Scanning -> Dispatching -> Draining -> Completed | Aborted.
//
// Dispatch is admission-controlled by the pool: a candidate is handed to a worker only once a slot
// is free. The error budget and the cancellation flag are checked before every dispatch; tripping
// either stops admitting work and returns without waiting for in-flight uploads. Those are joined
// when the orchestrator is destroyed.
class Orchestrator {
public:
    // Throws ConfigurationError for a zero worker count or an empty collection title and
    // DirectoryNotFound when the source directory is missing.
    Orchestrator(std::shared_ptr<remote::Client> client,
                 model::RunOptions options,
                 std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Throws AuthError.
    void authenticate();

    // Authenticates first when authenticate() was not called. Runs once.
    model::RunResult run();

    void cancel() const;

    [[nodiscard]] model::Phase phase() const { return phase_.load(); }
    [[nodiscard]] const std::string& collectionTitle() const { return collectionTitle_; }
    [[nodiscard]] size_t errors() const;

private:
    std::shared_ptr<remote::Client> client_;
    model::RunOptions options_;
    std::string collectionTitle_;
    std::shared_ptr<RunState> state_;
    std::shared_ptr<Uploader> uploader_;
    concurrency::ThreadPool pool_;
    std::vector<std::future<concurrency::ExpectedFuture>> futures_;
    std::atomic<model::Phase> phase_{model::Phase::Idle};
    bool authenticated_ = false;

    // None when dispatch may go on.
    [[nodiscard]] model::AbortReason checkAbort(const model::RunResult& result) const;
    model::RunResult& finishAborted(model::RunResult& result, model::AbortReason reason);
    void processFutures(model::RunResult& result);
};

// Directory base name after stripping trailing separators, trimmed.
std::string defaultCollectionTitle(const std::filesystem::path& directory);

}
