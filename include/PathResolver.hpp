#ifndef PATH_RESOLVER_HPP
#define PATH_RESOLVER_HPP

#include <filesystem>
#include <string>

#include "Protocol.hpp"

enum class PathError {
    NONE = 0,
    INVALID_PATH,      // Empty or otherwise unusable path text
    OUTSIDE_ROOT,      // Normalized path escapes the working directory
    NOT_FOUND,
    NOT_A_DIRECTORY,
    UNREADABLE         // Exists but the filesystem refused to read it
};

/**
 * ResolvedPath - Absolute, normalized path derived from user input
 */
struct ResolvedPath {
    std::filesystem::path path;
    bool valid = false;
    bool exists = false;
    PathError error = PathError::NONE;
};

/**
 * PathResolver - Turns user supplied paths into absolute paths
 *
 * Bare names and relative paths are joined to the working directory,
 * absolute paths are taken as-is, and "." / ".." are folded lexically.
 * With confinement enabled (server side) anything that lands outside the
 * working directory is rejected, and that check never touches the disk.
 * Extensions are not looked at.
 */
class PathResolver {
public:
    /**
     * @param raw_path Path text exactly as the user typed it
     * @param working_dir Directory relative paths are anchored to
     * @param confine_to_root Reject results outside working_dir
     * @return ResolvedPath; valid is false and error set on rejection
     */
    static ResolvedPath resolve(const std::string& raw_path,
                                const std::filesystem::path& working_dir,
                                bool confine_to_root);

    /** True if path is working_dir itself or lies beneath it (both normalized) */
    static bool isWithin(const std::filesystem::path& path,
                         const std::filesystem::path& working_dir);

    /** Wire status used to report a path error */
    static Protocol::StatusCode toStatus(PathError error);

    static const char* describe(PathError error);

private:
    PathResolver() = delete;
};

#endif // PATH_RESOLVER_HPP
