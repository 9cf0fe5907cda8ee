#pragma once

#include "remote/Client.hpp"
#include "util/errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lb::test {

// In-memory photo service that counts calls, fails chosen titles and can hold uploads at a gate.
class FakeClient final : public remote::Client {
public:
    std::atomic<int> authCalls{0}, uploadCalls{0}, listCalls{0}, createCalls{0}, memberListCalls{0}, addCalls{0};

    std::set<std::string> failTitles;
    bool failAuth = false;
    std::chrono::milliseconds createLatency{0};

    // Seeds an existing collection; returns its id.
    std::string addCollection(const std::string& title, const std::vector<std::string>& memberTitles = {}) {
        std::scoped_lock lock(mutex_);
        remote::model::Collection c;
        c.id = "set-" + std::to_string(++nextId_);
        c.title = title;
        for (const auto& t : memberTitles) c.members.push_back({"photo-" + std::to_string(++nextId_), t, c.id});
        collections_.push_back(c);
        return c.id;
    }

    [[nodiscard]] std::vector<remote::model::Collection> collections() const {
        std::scoped_lock lock(mutex_);
        return collections_;
    }

    [[nodiscard]] std::vector<std::string> uploadedTitles() const {
        std::scoped_lock lock(mutex_);
        return uploaded_;
    }

    // Uploads block until releaseUploads(); waitForInFlight(n) returns once n uploads are blocked.
    void closeGate() {
        std::scoped_lock lock(mutex_);
        gateClosed_ = true;
    }

    void releaseUploads() {
        {
            std::scoped_lock lock(mutex_);
            gateClosed_ = false;
        }
        cv_.notify_all();
    }

    bool waitForInFlight(const int n, const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return inFlight_ >= n; });
    }

    [[nodiscard]] int maxConcurrentUploads() const { return maxInFlight_.load(); }

    void authenticate(remote::Permission) override {
        ++authCalls;
        if (failAuth) throw AuthError("token rejected");
    }

    std::string upload(const remote::UploadRequest& req, const remote::ProgressFn& progress) override {
        ++uploadCalls;
        {
            std::unique_lock lock(mutex_);
            ++inFlight_;
            maxInFlight_ = std::max(maxInFlight_.load(), inFlight_);
            cv_.notify_all();
            cv_.wait(lock, [&] { return !gateClosed_; });
        }

        if (progress) progress(100, 100);

        std::scoped_lock lock(mutex_);
        --inFlight_;
        if (failTitles.contains(req.title)) throw UploadError("simulated failure for " + req.title);
        uploaded_.push_back(req.title);
        const auto id = "photo-" + std::to_string(++nextId_);
        titles_[id] = req.title;
        return id;
    }

    std::vector<remote::model::Collection> listCollections() override {
        ++listCalls;
        std::scoped_lock lock(mutex_);
        std::vector<remote::model::Collection> out;
        for (const auto& c : collections_) out.push_back({c.id, c.title, c.description, {}, false});
        return out;
    }

    remote::model::Collection createCollection(const std::string& title, const std::string& primaryItemId) override {
        ++createCalls;
        if (createLatency.count() > 0) std::this_thread::sleep_for(createLatency);
        std::scoped_lock lock(mutex_);
        remote::model::Collection c;
        c.id = "set-" + std::to_string(++nextId_);
        c.title = title;
        c.members.push_back({primaryItemId, titles_[primaryItemId], c.id});
        collections_.push_back(c);
        return {c.id, c.title, {}, {}, false};
    }

    std::vector<remote::model::Item> listCollectionMembers(const std::string& collectionId) override {
        ++memberListCalls;
        std::scoped_lock lock(mutex_);
        for (const auto& c : collections_)
            if (c.id == collectionId) return c.members;
        throw ApiError(1, "Photoset not found");
    }

    void addMember(const std::string& collectionId, const std::string& itemId) override {
        ++addCalls;
        std::scoped_lock lock(mutex_);
        for (auto& c : collections_) {
            if (c.id != collectionId) continue;
            for (const auto& m : c.members)
                if (m.id == itemId) return;
            c.members.push_back({itemId, titles_[itemId], c.id});
            return;
        }
        throw ApiError(1, "Photoset not found");
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<remote::model::Collection> collections_;
    std::map<std::string, std::string> titles_;
    std::vector<std::string> uploaded_;
    int nextId_ = 0;
    int inFlight_ = 0;
    std::atomic<int> maxInFlight_{0};
    bool gateClosed_ = false;
};

}
