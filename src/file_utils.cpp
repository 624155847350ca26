#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <unistd.h>

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string extension = fs::path(file_path).extension().string();
    if (extension == ".")
        return "";
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return extension;
}

bool FileUtils::exists(const std::string &path)
{
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileUtils::isReadable(const std::string &file_path)
{
    return ::access(file_path.c_str(), R_OK) == 0;
}

bool FileUtils::isWritableDirectory(const std::string &dir_path)
{
    return isValidDirectory(dir_path) && ::access(dir_path.c_str(), W_OK | X_OK) == 0;
}

bool FileUtils::ensureDirectory(const std::string &dir_path, std::error_code &ec)
{
    ec.clear();
    if (isValidDirectory(dir_path))
        return true;

    fs::create_directories(dir_path, ec);
    if (ec)
    {
        Logger::warn("Failed to create directory " + dir_path + ": " + ec.message());
        return false;
    }
    Logger::debug("Created directory: " + dir_path);
    return isValidDirectory(dir_path);
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::optional<uint64_t> FileUtils::getFileSize(const std::string &file_path)
{
    std::error_code ec;
    auto size = fs::file_size(file_path, ec);
    if (ec)
        return std::nullopt;
    return static_cast<uint64_t>(size);
}

std::optional<std::vector<uint8_t>> FileUtils::readFileBytes(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary | std::ios::ate);
    if (!file)
        return std::nullopt;

    const std::streamsize size = file.tellg();
    if (size < 0)
        return std::nullopt;
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char *>(bytes.data()), size))
        return std::nullopt;
    return bytes;
}

std::vector<std::string> FileUtils::listFiles(const std::string &dir_path, bool recursive)
{
    std::vector<std::string> files;
    if (!isValidDirectory(dir_path))
    {
        Logger::warn("Invalid directory path: " + dir_path);
        return files;
    }

    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        std::error_code ec;
        for (fs::directory_iterator it(current_path, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec))
            {
                files.push_back(it->path().string());
            }
            else if (recursive && it->is_directory(entry_ec))
            {
                scanDirectory(it->path());
            }
        }
        if (ec)
        {
            // Keep what was found so far, one unreadable directory does not stop the scan
            Logger::warn("Error accessing directory " + current_path.string() + ": " + ec.message());
        }
    };

    scanDirectory(dir_path);
    std::sort(files.begin(), files.end());
    return files;
}
