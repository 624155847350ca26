#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Filesystem helpers shared by the scrubber and the command line driver
 */
class FileUtils
{
public:
    /**
     * @brief Lower-cased extension including the dot (".jpg"), empty if none
     */
    static std::string getFileExtension(const std::string &file_path);

    static bool exists(const std::string &path);

    /**
     * @brief Check read access for the current process (access(2), R_OK)
     */
    static bool isReadable(const std::string &file_path);

    /**
     * @brief Check that path is a directory the process can create files in
     */
    static bool isWritableDirectory(const std::string &dir_path);

    /**
     * @brief Create a directory and its ancestors if missing
     * @param dir_path Directory to create
     * @param ec Set to the failure reason when creation fails
     * @return true if the directory exists afterwards
     */
    static bool ensureDirectory(const std::string &dir_path, std::error_code &ec);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    static std::optional<uint64_t> getFileSize(const std::string &file_path);

    /**
     * @brief Read an entire file into memory
     * @return std::nullopt if the file cannot be opened or read
     */
    static std::optional<std::vector<uint8_t>> readFileBytes(const std::string &file_path);

    /**
     * Lists regular files in a directory
     * @param dir_path Directory path to scan
     * @param recursive Whether to descend into subdirectories
     * @return File paths sorted lexicographically
     */
    static std::vector<std::string> listFiles(const std::string &dir_path, bool recursive = false);
};
