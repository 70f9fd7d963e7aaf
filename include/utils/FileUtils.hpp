#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

namespace compartmental {

/**
 * @namespace FileUtils
 * @brief Path helpers used by the command-line driver to place configuration and result files.
 */
namespace FileUtils {
    /**
     * @brief Ensures the specified directory exists, creating it if necessary.
     * @param path [in] Directory path to check/create
     * @return true if the directory exists or was successfully created, false otherwise
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Locates the project root directory.
     * @details Walks up to five levels from the working directory looking for a directory
     * that contains `data`, `include` and `src`. Falls back to the working directory.
     */
    std::string getProjectRoot();

    /**
     * @brief Path inside `<project root>/data/output`, creating the directory when needed.
     * @param filename [in] Optional filename to append (empty by default)
     */
    std::string getOutputPath(const std::string& filename = "");

    /** @brief Joins two path segments; a leading '/' on the second segment is ignored. */
    std::string joinPaths(const std::string& path1, const std::string& path2);
}

} // namespace compartmental

#endif
