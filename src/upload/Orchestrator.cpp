#include "upload/Orchestrator.hpp"
#include "upload/RunState.hpp"
#include "upload/Uploader.hpp"
#include "upload/tasks/Upload.hpp"
#include "catalog/FileCatalog.hpp"
#include "remote/Client.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <chrono>
#include <stdexcept>

using namespace lb::upload;
using namespace lb::upload::model;
using namespace lb::log;

namespace fs = std::filesystem;

namespace {

RunOptions checked(RunOptions options) {
    if (options.threads == 0) throw lb::ConfigurationError("Worker count must be a positive integer");
    std::error_code ec;
    if (!fs::is_directory(options.directory, ec))
        throw lb::DirectoryNotFound("Directory not found: " + options.directory.string());
    return options;
}

std::string resolveTitle(const RunOptions& options) {
    auto title = options.collectionTitle.empty() ? lb::upload::defaultCollectionTitle(options.directory)
                                                 : options.collectionTitle;
    lb::util::trimInPlace(title);
    if (title.empty()) throw lb::ConfigurationError("Could not derive a set name from " + options.directory.string());
    return title;
}

}

std::string lb::upload::defaultCollectionTitle(const fs::path& directory) {
    auto s = directory.string();
    while (s.size() > 1 && (s.back() == '/' || s.back() == fs::path::preferred_separator)) s.pop_back();
    auto name = fs::path(s).filename().string();
    util::trimInPlace(name);
    return name;
}

Orchestrator::Orchestrator(std::shared_ptr<remote::Client> client, RunOptions options,
                           std::shared_ptr<std::atomic<bool>> interruptFlag)
    : client_(std::move(client)),
      options_(checked(std::move(options))),
      collectionTitle_(resolveTitle(options_)),
      state_(std::make_shared<RunState>(client_, std::move(interruptFlag))),
      uploader_(std::make_shared<Uploader>(client_, state_, collectionTitle_)),
      pool_(options_.threads) {}

Orchestrator::~Orchestrator() {
    // Drops queued uploads and waits for the ones already running
    pool_.stop();
}

void Orchestrator::authenticate() {
    if (authenticated_) return;
    Registry::upload()->debug("[Orchestrator] Authenticating with {} permission", remote::to_string(options_.permission));
    client_->authenticate(options_.permission);
    authenticated_ = true;
}

RunResult Orchestrator::run() {
    if (phase_.load() != Phase::Idle) throw std::logic_error("Orchestrator::run() may only be called once");
    authenticate();

    RunResult result;
    phase_ = result.phase = Phase::Scanning;

    const catalog::FileCatalog files(options_.extensions);
    const auto candidates = files.listCandidates(options_.directory);
    result.candidates = candidates.size();
    result.errorBudget = options_.budget.allowedFor(candidates.size());

    Registry::upload()->info("Uploading {} photos to set \"{}\" with {} workers (error budget {})",
                             result.candidates, collectionTitle_, options_.threads, result.errorBudget);

    phase_ = result.phase = Phase::Dispatching;
    futures_.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (const auto reason = checkAbort(result); reason != AbortReason::None) return finishAborted(result, reason);

        auto slot = pool_.acquire();

        // Failures or a signal may have landed while waiting for the slot
        if (const auto reason = checkAbort(result); reason != AbortReason::None) return finishAborted(result, reason);

        const auto& path = candidates[i];
        auto task = std::make_shared<tasks::Upload>(
            uploader_, state_, UploadTask{path, catalog::FileCatalog::titleFor(path), options_.tags, options_.isPublic});
        futures_.push_back(task->getFuture().value());

        Registry::upload()->info("{}/{} Uploading {}", i + 1, candidates.size(), path.string());
        pool_.submit(std::move(slot), task);
        ++result.dispatched;
    }

    phase_ = result.phase = Phase::Draining;
    pool_.drain();
    processFutures(result);

    if (state_->cancelled()) return finishAborted(result, AbortReason::CancellationRequested);
    if (ErrorBudget::exceeded(state_->errors(), result.errorBudget)) return finishAborted(result, AbortReason::BudgetExceeded);

    phase_ = result.phase = Phase::Completed;
    if (result.failed > 0) Registry::upload()->warn("Finished all uploads with {} errors", result.failed);
    Registry::lightbox()->info("Run summary: {}", result.summary());
    return result;
}

void Orchestrator::cancel() const {
    state_->cancel();
}

size_t Orchestrator::errors() const {
    return state_->errors();
}

AbortReason Orchestrator::checkAbort(const RunResult& result) const {
    if (ErrorBudget::exceeded(state_->errors(), result.errorBudget)) return AbortReason::BudgetExceeded;
    if (state_->cancelled()) return AbortReason::CancellationRequested;
    return AbortReason::None;
}

RunResult& Orchestrator::finishAborted(RunResult& result, const AbortReason reason) {
    if (reason == AbortReason::BudgetExceeded)
        Registry::upload()->critical("Too many upload errors: {}. Aborting.", state_->errors());
    else
        Registry::upload()->warn("Aborting uploads due to user request.");

    // Tally what already finished; in-flight uploads are left to complete on their own
    for (auto& f : futures_) {
        if (!f.valid() || f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) continue;
        try {
            switch (f.get()) {
            case Outcome::Uploaded: ++result.uploaded; break;
            case Outcome::Skipped: ++result.skipped; break;
            case Outcome::Failed: break;
            }
        } catch (const std::future_error& e) {
            Registry::upload()->debug("[Orchestrator] Upload task dropped: {}", e.what());
        }
    }

    futures_.clear();
    result.failed = state_->errors();
    result.reason = reason;
    phase_ = result.phase = Phase::Aborted;
    Registry::lightbox()->info("Run summary: {}", result.summary());
    return result;
}

void Orchestrator::processFutures(RunResult& result) {
    for (auto& f : futures_) {
        try {
            switch (f.get()) {
            case Outcome::Uploaded: ++result.uploaded; break;
            case Outcome::Skipped: ++result.skipped; break;
            case Outcome::Failed: break;
            }
        } catch (const std::future_error& e) {
            Registry::upload()->error("[Orchestrator] Upload task dropped: {}", e.what());
        }
    }
    futures_.clear();
    result.failed = state_->errors();
}
