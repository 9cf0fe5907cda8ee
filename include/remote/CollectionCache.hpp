#pragma once

#include "remote/MemberQuery.hpp"
#include "remote/model/Collection.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace lb::remote {

class Client;

// Memoized, thread-safe view of the remote collections touched by one run.
//
// The lock is owned by the run state and shared with its error counter. Everything that fetches,
// creates or adds runs under an exclusive lock; lookups against data that is already memoized only
// take a shared lock. Remote listings are fetched at most once per run unless a refresh is asked for.
class CollectionCache {
public:
    CollectionCache(std::shared_ptr<Client> client, std::shared_mutex& mutex);

    // nullptr when no collection with this exact title exists; that is not an error.
    std::shared_ptr<model::Collection> getCollection(const std::string& title, bool refresh = false);

    // Walks the membership once per collection; refresh forces a new walk.
    // Throws std::invalid_argument for an empty key or a null collection.
    bool hasItem(const std::shared_ptr<model::Collection>& collection, const MemberQuery& query, bool refresh = false);

    // Double-checked under the exclusive lock so concurrent first uploads create one collection.
    // Returns the collection and whether this call created it.
    std::pair<std::shared_ptr<model::Collection>, bool>
    getOrCreateCollection(const std::string& title, const std::string& primaryItemId);

    // Idempotent: no remote call when the item is already a member.
    void addItem(const std::shared_ptr<model::Collection>& collection, const model::Item& item);
    void addItem(const std::shared_ptr<model::Collection>& collection, const std::string& itemId);

private:
    std::shared_ptr<Client> client_;
    std::shared_mutex& mutex_;
    std::unordered_map<std::string, std::shared_ptr<model::Collection>> byTitle_;
    bool listed_ = false;

    void ensureListedLocked(bool refresh);
    [[nodiscard]] std::shared_ptr<model::Collection> findLocked(const std::string& title) const;
    void loadMembersLocked(model::Collection& collection) const;
};

}
