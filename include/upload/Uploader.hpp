#pragma once

#include "upload/model/Outcome.hpp"
#include "upload/model/UploadTask.hpp"

#include <memory>
#include <string>

namespace lb::remote { class Client; }

namespace lb::upload {

class RunState;

// Uploads one file and records it in the target collection. Shared by every worker of a run.
class Uploader {
public:
    Uploader(std::shared_ptr<remote::Client> client, std::shared_ptr<RunState> state, std::string collectionTitle);

    // Skipped when the title is already in the collection. Throws on upload or collection failures;
    // counting them is left to the caller.
    model::Outcome uploadOne(const model::UploadTask& task) const;

    [[nodiscard]] const std::string& collectionTitle() const { return collectionTitle_; }

private:
    std::shared_ptr<remote::Client> client_;
    std::shared_ptr<RunState> state_;
    std::string collectionTitle_;
};

}
