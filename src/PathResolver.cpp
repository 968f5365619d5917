#include "PathResolver.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace {

    // Lexical normalization without the trailing empty element "a/b/" keeps
    fs::path normalize(const fs::path& p) {
        fs::path normal = p.lexically_normal();
        if (!normal.has_filename() && normal != normal.root_path()) {
            normal = normal.parent_path();
        }
        return normal;
    }

    fs::path absoluteRoot(const fs::path& working_dir) {
        if (working_dir.is_absolute()) return normalize(working_dir);

        std::error_code ec;
        fs::path absolute = fs::absolute(working_dir, ec);
        return normalize(ec ? working_dir : absolute);
    }

} // namespace


ResolvedPath PathResolver::resolve(const std::string& raw_path,
                                   const fs::path& working_dir,
                                   bool confine_to_root) {
    ResolvedPath result;

    if (raw_path.empty() || raw_path.find('\0') != std::string::npos) {
        result.error = PathError::INVALID_PATH;
        return result;
    }

    fs::path root = absoluteRoot(working_dir);
    fs::path raw(raw_path);
    fs::path candidate = normalize(raw.is_absolute() ? raw : root / raw);

    // Confinement is decided purely lexically, before any filesystem access
    if (confine_to_root && !isWithin(candidate, root)) {
        result.path = candidate;
        result.error = PathError::OUTSIDE_ROOT;
        return result;
    }

    std::error_code ec;
    bool exists = fs::exists(candidate, ec);

    result.path = candidate;
    result.valid = true;
    result.exists = exists && !ec;
    return result;
}


bool PathResolver::isWithin(const fs::path& path, const fs::path& working_dir) {
    fs::path p = normalize(path);
    fs::path root = normalize(working_dir);

    auto diverge = std::mismatch(root.begin(), root.end(), p.begin(), p.end());
    return diverge.first == root.end();
}


Protocol::StatusCode PathResolver::toStatus(PathError error) {
    switch (error) {
        case PathError::NONE:            return Protocol::StatusCode::OK;
        case PathError::INVALID_PATH:    return Protocol::StatusCode::BAD_COMMAND;
        case PathError::OUTSIDE_ROOT:    return Protocol::StatusCode::OUTSIDE_ROOT;
        case PathError::NOT_FOUND:       return Protocol::StatusCode::FILE_NOT_FOUND;
        case PathError::NOT_A_DIRECTORY: return Protocol::StatusCode::NOT_A_DIRECTORY;
        case PathError::UNREADABLE:      return Protocol::StatusCode::IO_ERROR;
    }
    return Protocol::StatusCode::IO_ERROR;
}


const char* PathResolver::describe(PathError error) {
    switch (error) {
        case PathError::NONE:            return "ok";
        case PathError::INVALID_PATH:    return "invalid path";
        case PathError::OUTSIDE_ROOT:    return "path escapes the server root";
        case PathError::NOT_FOUND:       return "no such file or directory";
        case PathError::NOT_A_DIRECTORY: return "not a directory";
        case PathError::UNREADABLE:      return "could not be read";
    }
    return "unknown path error";
}
