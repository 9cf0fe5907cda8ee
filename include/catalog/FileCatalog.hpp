#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace lb::catalog {

class FileCatalog {
public:
    // Extensions are matched case-insensitively, with or without a leading dot.
    explicit FileCatalog(std::vector<std::string> extensions);

    // Regular, non-hidden files with a supported extension, sorted by path.
    // Throws DirectoryNotFound when directory is missing or not a directory.
    [[nodiscard]] std::vector<std::filesystem::path> listCandidates(const std::filesystem::path& directory) const;

    [[nodiscard]] bool isSupported(const std::filesystem::path& path) const;

    // Remote title for a local file: its base name, extension included.
    static std::string titleFor(const std::filesystem::path& path);

private:
    std::vector<std::string> extensions_;
};

}
