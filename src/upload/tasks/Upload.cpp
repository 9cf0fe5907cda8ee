#include "upload/tasks/Upload.hpp"
#include "upload/Uploader.hpp"
#include "upload/RunState.hpp"
#include "log/Registry.hpp"

using namespace lb::upload::tasks;
using namespace lb::upload::model;
using namespace lb::log;

Upload::Upload(std::shared_ptr<Uploader> uploader, std::shared_ptr<RunState> state, UploadTask task)
    : uploader(std::move(uploader)), state(std::move(state)), task(std::move(task)) {}

void Upload::operator()() {
    auto outcome = Outcome::Failed;
    try {
        outcome = uploader->uploadOne(task);
    } catch (const std::exception& e) {
        const auto errors = state->recordFailure();
        Registry::upload()->error("Error uploading \"{}\": {} ({} errors so far)", task.path.string(), e.what(), errors);
    }

    promise.set_value(outcome);
}
