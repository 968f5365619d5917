#ifndef DIRECTORY_LISTER_HPP
#define DIRECTORY_LISTER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "PathResolver.hpp"

/**
 * DirectoryLister - Names of the entries directly inside a directory
 *
 * Entries are returned sorted in ascending byte order so repeated listings
 * of an unchanged directory are identical. Not recursive.
 */
class DirectoryLister {
public:
    /**
     * @param dir Resolved directory path
     * @param out Entry names (file names only, no path prefix)
     * @return NONE, NOT_FOUND, NOT_A_DIRECTORY, or UNREADABLE if the
     *         directory could not be read
     */
    static PathError list(const std::filesystem::path& dir, std::vector<std::string>& out);

private:
    DirectoryLister() = delete;
};

#endif // DIRECTORY_LISTER_HPP
