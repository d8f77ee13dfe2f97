#include "lanxfer/directory.hpp"
#include "lanxfer/error.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace lanxfer {

DirectoryListing enumerate_directory(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw TransferError(ErrorCode::NotFound, "Directory not found: " + root.string());
    }

    DirectoryListing listing;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw TransferError(ErrorCode::IoError, "Cannot scan " + root.string() + ": " + ec.message());
    }

    const fs::recursive_directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        std::error_code fec;
        if (!entry.is_regular_file(fec)) continue;

        const std::uintmax_t size = entry.file_size(fec);
        if (fec) {
            throw TransferError(ErrorCode::IoError,
                                "Cannot stat " + entry.path().string() + ": " + fec.message());
        }

        DirEntry e;
        e.relative_path = entry.path().lexically_relative(root).generic_string();
        e.absolute_path = entry.path();
        e.size = static_cast<std::uint64_t>(size);
        listing.total_bytes += e.size;
        listing.entries.push_back(std::move(e));
    }
    if (ec) {
        throw TransferError(ErrorCode::IoError, "Cannot scan " + root.string() + ": " + ec.message());
    }

    std::sort(listing.entries.begin(), listing.entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.relative_path < b.relative_path; });
    return listing;
}

} // namespace lanxfer
