#include "core/artifact_store.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace
{
    // Best effort: makes a completed rename survive power loss on most filesystems
    void syncDirectory(const std::filesystem::path &directory)
    {
        int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fd < 0)
            return;
        if (::fsync(fd) != 0)
            Logger::debug("fsync of directory " + directory.string() + " failed: " + std::strerror(errno));
        ::close(fd);
    }
}

const char *const PosixArtifactStore::TEMP_PREFIX = ".metascrub-";

IoStatus IoStatus::fromErrno(int error_code, const std::string &operation, const std::string &path)
{
    IoStatus status;
    status.error_code = error_code;
    status.operation = operation;
    status.message = std::string(std::strerror(error_code)) + ": '" + path + "'";
    return status;
}

IoStatus PosixArtifactStore::createTemp(const std::filesystem::path &directory, const std::string &suffix,
                                        std::filesystem::path &temp_path)
{
    std::string pattern = (directory / (std::string(TEMP_PREFIX) + "XXXXXX" + suffix)).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = ::mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0)
        return IoStatus::fromErrno(errno, "create temp file", pattern);

    if (::close(fd) != 0)
    {
        int err = errno;
        ::unlink(buffer.data());
        return IoStatus::fromErrno(err, "create temp file", buffer.data());
    }

    temp_path = buffer.data();
    return IoStatus::success();
}

IoStatus PosixArtifactStore::writeAll(const std::filesystem::path &temp_path, const std::vector<uint8_t> &data)
{
    int fd = ::open(temp_path.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
    if (fd < 0)
        return IoStatus::fromErrno(errno, "open", temp_path.string());

    size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            int err = errno;
            ::close(fd);
            return IoStatus::fromErrno(err, "write", temp_path.string());
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0)
    {
        int err = errno;
        ::close(fd);
        return IoStatus::fromErrno(err, "fsync", temp_path.string());
    }

    // NFS and some FUSE filesystems report deferred write errors only here
    if (::close(fd) != 0)
        return IoStatus::fromErrno(errno, "close", temp_path.string());

    return IoStatus::success();
}

IoStatus PosixArtifactStore::commit(const std::filesystem::path &temp_path, const std::filesystem::path &destination)
{
    if (::rename(temp_path.c_str(), destination.c_str()) != 0)
        return IoStatus::fromErrno(errno, "rename", destination.string());

    syncDirectory(destination.has_parent_path() ? destination.parent_path() : std::filesystem::path("."));
    return IoStatus::success();
}

IoStatus PosixArtifactStore::remove(const std::filesystem::path &path) noexcept
{
    if (::unlink(path.c_str()) != 0 && errno != ENOENT)
        return IoStatus::fromErrno(errno, "unlink", path.string());
    return IoStatus::success();
}

TempArtifact::~TempArtifact()
{
    if (path_.empty() || committed_)
        return;

    IoStatus status = store_.remove(path_);
    if (!status.ok())
    {
        // The caller already has the primary error; a leftover temp file is only logged
        Logger::debug("Could not remove temp file: " + status.message);
    }
}

IoStatus TempArtifact::create(const std::filesystem::path &directory, const std::string &suffix)
{
    return store_.createTemp(directory, suffix, path_);
}

IoStatus TempArtifact::write(const std::vector<uint8_t> &data)
{
    return store_.writeAll(path_, data);
}

IoStatus TempArtifact::commitTo(const std::filesystem::path &destination)
{
    IoStatus status = store_.commit(path_, destination);
    if (status.ok())
    {
        committed_ = true;
        path_.clear();
    }
    return status;
}
