#pragma once

#include "concurrency/Task.hpp"
#include "upload/model/Outcome.hpp"
#include "upload/model/UploadTask.hpp"

#include <memory>

namespace lb::upload {
class Uploader;
class RunState;
}

namespace lb::upload::tasks {

struct Upload final : concurrency::PromisedTask {
    std::shared_ptr<Uploader> uploader;
    std::shared_ptr<RunState> state;
    model::UploadTask task;

    Upload(std::shared_ptr<Uploader> uploader, std::shared_ptr<RunState> state, model::UploadTask task);

    void operator()() override;
};

}
