#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lanxfer {

struct DirEntry {
    std::string relative_path;          // generic form, '/' separated
    std::filesystem::path absolute_path;
    std::uint64_t size = 0;
};

struct DirectoryListing {
    std::vector<DirEntry> entries;      // sorted by relative_path
    std::uint64_t total_bytes = 0;
};

// Recursively lists regular files under root. Throws TransferError(NotFound)
// when root is not a directory; an empty listing is not an error here.
DirectoryListing enumerate_directory(const std::filesystem::path& root);

} // namespace lanxfer
