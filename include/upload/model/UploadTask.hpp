#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace lb::upload::model {

struct UploadTask {
    std::filesystem::path path;
    std::string title;
    std::vector<std::string> tags;
    bool is_public = false;
};

}
