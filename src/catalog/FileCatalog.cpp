#include "catalog/FileCatalog.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <algorithm>

using namespace lb::catalog;
using namespace lb::log;
using namespace lb::util;

namespace fs = std::filesystem;

FileCatalog::FileCatalog(std::vector<std::string> extensions) {
    for (auto& ext : extensions) {
        auto lowered = toLower(ext);
        if (!lowered.empty() && lowered.front() == '.') lowered.erase(0, 1);
        if (!lowered.empty()) extensions_.push_back(std::move(lowered));
    }
}

std::vector<fs::path> FileCatalog::listCandidates(const fs::path& directory) const {
    std::error_code ec;
    if (!fs::is_directory(directory, ec))
        throw lb::DirectoryNotFound("Directory not found: " + directory.string());

    std::vector<fs::path> candidates;
    for (const auto& entry : fs::directory_iterator(directory)) {
        const auto name = entry.path().filename().string();
        if (name.starts_with('.')) {
            Registry::catalog()->debug("[FileCatalog] Skipping hidden entry {}", name);
            continue;
        }

        if (!entry.is_regular_file(ec)) {
            Registry::catalog()->debug("[FileCatalog] Skipping non-regular entry {}", name);
            continue;
        }

        if (!isSupported(entry.path())) {
            Registry::catalog()->debug("[FileCatalog] Skipping unsupported file {}", name);
            continue;
        }

        candidates.push_back(entry.path());
    }

    std::ranges::sort(candidates, [](const fs::path& a, const fs::path& b) { return a.string() < b.string(); });

    Registry::catalog()->debug("[FileCatalog] {} candidates in {}", candidates.size(), directory.string());
    return candidates;
}

bool FileCatalog::isSupported(const fs::path& path) const {
    auto ext = path.extension().string();
    if (ext.size() < 2) return false;
    ext = toLower(ext.substr(1));
    return std::ranges::find(extensions_, ext) != extensions_.end();
}

std::string FileCatalog::titleFor(const fs::path& path) {
    return path.filename().string();
}
