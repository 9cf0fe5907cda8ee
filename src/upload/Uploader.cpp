#include "upload/Uploader.hpp"
#include "upload/RunState.hpp"
#include "remote/Client.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <stdexcept>

using namespace lb::upload;
using namespace lb::upload::model;
using namespace lb::remote;
using namespace lb::log;

Uploader::Uploader(std::shared_ptr<Client> client, std::shared_ptr<RunState> state, std::string collectionTitle)
    : client_(std::move(client)), state_(std::move(state)), collectionTitle_(std::move(collectionTitle)) {
    if (!client_) throw std::invalid_argument("Uploader needs a remote client");
    if (!state_) throw std::invalid_argument("Uploader needs run state");
    if (collectionTitle_.empty()) throw lb::ConfigurationError("Collection title must not be empty");
}

Outcome Uploader::uploadOne(const UploadTask& task) const {
    auto& cache = state_->collections();

    auto collection = cache.getCollection(collectionTitle_);
    if (collection && cache.hasItem(collection, ByTitle{task.title})) {
        Registry::upload()->info("Photo with title \"{}\" already exists in set \"{}\"", task.title, collectionTitle_);
        return Outcome::Skipped;
    }

    const auto fileName = task.path.filename().string();
    unsigned int lastQuarter = 0;
    const ProgressFn progress = [&](const uint64_t sent, const uint64_t total) {
        if (total == 0) return;
        const auto quarter = static_cast<unsigned int>(sent * 4 / total);
        if (quarter <= lastQuarter) return;
        lastQuarter = quarter;
        Registry::upload()->debug("[Uploader] {}: {}% uploaded", fileName, quarter * 25);
    };

    const auto id = client_->upload(UploadRequest{task.path, task.title, task.tags, task.is_public}, progress);
    if (id.empty()) throw lb::UploadError("Upload of " + task.path.string() + " returned no photo id");

    if (!collection) collection = cache.getOrCreateCollection(collectionTitle_, id).first;

    cache.addItem(collection, lb::remote::model::Item{id, task.title, collection->id});
    return Outcome::Uploaded;
}
