#pragma once

#include "remote/CollectionCache.hpp"

#include <atomic>
#include <memory>
#include <shared_mutex>

namespace lb::remote { class Client; }

namespace lb::upload {

// Per-run context handed to every worker. One lock guards the error counter and the collection
// cache; the cancellation flag is shared with whoever may raise it (signal handler, orchestrator).
class RunState {
public:
    RunState(std::shared_ptr<remote::Client> client, std::shared_ptr<std::atomic<bool>> interruptFlag);

    RunState(const RunState&) = delete;
    RunState& operator=(const RunState&) = delete;

    // Returns the error count after this failure.
    size_t recordFailure();
    [[nodiscard]] size_t errors() const;

    void cancel() const { interruptFlag_->store(true); }
    [[nodiscard]] bool cancelled() const { return interruptFlag_->load(); }

    remote::CollectionCache& collections() { return collections_; }

private:
    mutable std::shared_mutex mutex_;
    size_t errorCount_ = 0;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    remote::CollectionCache collections_;
};

}
