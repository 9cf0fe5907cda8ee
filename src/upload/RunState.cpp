#include "upload/RunState.hpp"
#include "remote/Client.hpp"

#include <mutex>
#include <stdexcept>

using namespace lb::upload;

RunState::RunState(std::shared_ptr<remote::Client> client, std::shared_ptr<std::atomic<bool>> interruptFlag)
    : interruptFlag_(interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false)),
      collections_(std::move(client), mutex_) {}

size_t RunState::recordFailure() {
    std::unique_lock lock(mutex_);
    return ++errorCount_;
}

size_t RunState::errors() const {
    std::shared_lock lock(mutex_);
    return errorCount_;
}
