#include "remote/CollectionCache.hpp"
#include "remote/Client.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

using namespace lb::remote;
using namespace lb::remote::model;
using namespace lb::log;

CollectionCache::CollectionCache(std::shared_ptr<Client> client, std::shared_mutex& mutex)
    : client_(std::move(client)), mutex_(mutex) {
    if (!client_) throw std::invalid_argument("CollectionCache needs a remote client");
}

std::shared_ptr<Collection> CollectionCache::getCollection(const std::string& title, const bool refresh) {
    if (!refresh) {
        std::shared_lock lock(mutex_);
        if (listed_) return findLocked(title);
    }

    std::unique_lock lock(mutex_);
    ensureListedLocked(refresh);
    return findLocked(title);
}

bool CollectionCache::hasItem(const std::shared_ptr<Collection>& collection, const MemberQuery& query, const bool refresh) {
    validate(query);
    if (!collection) throw std::invalid_argument("Membership lookup needs a collection");

    const auto found = [&] {
        return std::ranges::any_of(collection->members, [&](const Item& i) { return matches(i, query); });
    };

    if (!refresh) {
        std::shared_lock lock(mutex_);
        if (collection->members_loaded) return found();
    }

    std::unique_lock lock(mutex_);
    if (refresh || !collection->members_loaded) loadMembersLocked(*collection);
    return found();
}

std::pair<std::shared_ptr<Collection>, bool>
CollectionCache::getOrCreateCollection(const std::string& title, const std::string& primaryItemId) {
    if (primaryItemId.empty()) throw std::invalid_argument("A new collection needs a primary item");

    std::unique_lock lock(mutex_);
    ensureListedLocked(false);
    if (auto existing = findLocked(title)) return {existing, false};

    Registry::remote()->info("[CollectionCache] Creating photoset \"{}\", primary photo id: {}", title, primaryItemId);

    auto created = std::make_shared<Collection>(client_->createCollection(title, primaryItemId));
    if (created->title.empty()) created->title = title;

    // A fresh collection holds exactly its primary item
    created->members = {Item{primaryItemId, {}, created->id}};
    created->members_loaded = true;

    byTitle_.insert_or_assign(title, created);
    return {created, true};
}

void CollectionCache::addItem(const std::shared_ptr<Collection>& collection, const Item& item) {
    if (!collection) throw std::invalid_argument("addItem needs a collection");
    if (item.id.empty()) throw std::invalid_argument("addItem needs an item id");

    std::unique_lock lock(mutex_);
    if (!collection->members_loaded) loadMembersLocked(*collection);

    const auto it = std::ranges::find_if(collection->members, [&](const Item& i) { return i.id == item.id; });
    if (it != collection->members.end()) {
        if (it->title.empty()) it->title = item.title;
        return;
    }

    Registry::remote()->debug("[CollectionCache] Adding photo {} to photoset \"{}\"", item.id, collection->title);
    client_->addMember(collection->id, item.id);
    collection->members.push_back(Item{item.id, item.title, collection->id});
}

void CollectionCache::addItem(const std::shared_ptr<Collection>& collection, const std::string& itemId) {
    addItem(collection, Item{itemId, {}, std::nullopt});
}

void CollectionCache::ensureListedLocked(const bool refresh) {
    if (listed_ && !refresh) return;

    Registry::remote()->debug("[CollectionCache] Requesting all photosets");
    auto listing = client_->listCollections();

    std::unordered_map<std::string, std::shared_ptr<Collection>> rebuilt;
    for (auto& c : listing) {
        // Keep memoized membership of collections we already hold
        const auto existing = std::ranges::find_if(byTitle_, [&](const auto& kv) { return kv.second->id == c.id; });
        std::shared_ptr<Collection> entry;
        if (existing != byTitle_.end()) {
            entry = existing->second;
            entry->title = c.title;
            entry->description = c.description;
        } else {
            entry = std::make_shared<Collection>(std::move(c));
        }

        // First listed wins when titles collide
        if (!rebuilt.emplace(entry->title, entry).second)
            Registry::remote()->warn("[CollectionCache] Several photosets titled \"{}\", using id {}",
                                     entry->title, rebuilt.at(entry->title)->id);
    }

    byTitle_ = std::move(rebuilt);
    listed_ = true;
}

std::shared_ptr<Collection> CollectionCache::findLocked(const std::string& title) const {
    const auto it = byTitle_.find(title);
    return it == byTitle_.end() ? nullptr : it->second;
}

void CollectionCache::loadMembersLocked(Collection& collection) const {
    Registry::remote()->debug("[CollectionCache] Walking photoset \"{}\" ({})", collection.title, collection.id);
    auto members = client_->listCollectionMembers(collection.id);
    for (auto& m : members) m.collection_id = collection.id;
    collection.members = std::move(members);
    collection.members_loaded = true;
}
