#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

/**
 * @namespace FileUtils
 * @brief Contains utilities for file and directory operations used by the run pipeline.
 */
namespace FileUtils {
    /**
     * @brief Ensures the specified directory exists, creating it if necessary.
     * @param path [in] Directory path to check/create
     * @return true if the directory exists or was successfully created, false otherwise
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Joins two path segments using the proper path separator.
     * @details A leading '/' on the second segment is ignored so config values
     * such as "/data.csv" stay relative to the first segment.
     * @param path1 [in] First path segment
     * @param path2 [in] Second path segment
     * @return Combined path as a string
     */
    std::string joinPaths(const std::string& path1, const std::string& path2);

    /**
     * @brief Returns true if the path names an existing regular file.
     */
    bool fileExists(const std::string& path);

    /**
     * @brief Removes a file if present.
     * @return true if a file was removed.
     * @throws episim::FileIOException If the file exists but cannot be removed
     */
    bool removeFileIfExists(const std::string& path);

    /**
     * @brief Builds (and creates) the output directory of a run instance.
     * @param instanceFolder [in] Instance directory
     * @param outputFolder [in] Sub-folder name, "output" when empty
     * @return The directory path
     * @throws episim::FileIOException If the directory cannot be created
     */
    std::string getOutputPath(const std::string& instanceFolder, const std::string& outputFolder);
}

#endif
