#include "DirectoryLister.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;


PathError DirectoryLister::list(const fs::path& dir, std::vector<std::string>& out) {
    out.clear();

    std::error_code ec;
    fs::file_status status = fs::status(dir, ec);
    if (!fs::exists(status)) return PathError::NOT_FOUND;
    if (!fs::is_directory(status)) return PathError::NOT_A_DIRECTORY;

    fs::directory_iterator it(dir, ec);
    if (ec) {
        std::cerr << "[DirectoryLister] Cannot open " << dir << ": " << ec.message() << "\n";
        return PathError::UNREADABLE;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        out.push_back(it->path().filename().string());
    }
    if (ec) {
        std::cerr << "[DirectoryLister] Failed while reading " << dir << ": " << ec.message() << "\n";
        out.clear();
        return PathError::UNREADABLE;
    }

    std::sort(out.begin(), out.end());
    return PathError::NONE;
}
