#pragma once

#include <optional>
#include <string>

namespace lb::remote::model {

// Content already known to the remote store. The id is assigned remotely on upload.
struct Item {
    std::string id;
    std::string title;
    std::optional<std::string> collection_id;
};

}
