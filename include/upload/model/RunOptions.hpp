#pragma once

#include "remote/Client.hpp"
#include "upload/model/ErrorBudget.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace lb::upload::model {

struct RunOptions {
    std::filesystem::path directory;
    std::string collectionTitle;     // empty: derived from the directory name
    std::vector<std::string> tags;
    unsigned int threads = 4;
    bool isPublic = false;
    remote::Permission permission = remote::Permission::Write;
    ErrorBudget budget;
    std::vector<std::string> extensions = {"jpg", "jpeg", "png", "gif", "tif", "tiff"};
};

}
