#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Outcome of one filesystem step, carrying errno on failure
 */
struct IoStatus
{
    int error_code = 0;    // errno value, 0 on success
    std::string operation; // Step that failed, e.g. "rename"
    std::string message;   // strerror text plus the path involved

    bool ok() const { return error_code == 0; }

    static IoStatus success() { return IoStatus{}; }
    static IoStatus fromErrno(int error_code, const std::string &operation, const std::string &path);
};

/**
 * @brief Filesystem operations used to stage and publish scrubbed output
 *
 * The default implementation talks to POSIX directly. Tests substitute an
 * implementation that fails a chosen step with a chosen errno.
 */
class ArtifactStore
{
public:
    virtual ~ArtifactStore() = default;

    /**
     * @brief Create a new, uniquely named, empty file in a directory
     * @param directory Directory to create the file in
     * @param suffix Suffix appended after the unique token
     * @param temp_path Receives the created path on success
     */
    virtual IoStatus createTemp(const std::filesystem::path &directory, const std::string &suffix,
                                std::filesystem::path &temp_path) = 0;

    /**
     * @brief Replace the contents of a staged file and flush it to stable storage
     */
    virtual IoStatus writeAll(const std::filesystem::path &temp_path, const std::vector<uint8_t> &data) = 0;

    /**
     * @brief Atomically rename a staged file onto its destination
     */
    virtual IoStatus commit(const std::filesystem::path &temp_path, const std::filesystem::path &destination) = 0;

    virtual IoStatus remove(const std::filesystem::path &path) noexcept = 0;
};

class PosixArtifactStore : public ArtifactStore
{
public:
    IoStatus createTemp(const std::filesystem::path &directory, const std::string &suffix,
                        std::filesystem::path &temp_path) override;
    IoStatus writeAll(const std::filesystem::path &temp_path, const std::vector<uint8_t> &data) override;
    IoStatus commit(const std::filesystem::path &temp_path, const std::filesystem::path &destination) override;
    IoStatus remove(const std::filesystem::path &path) noexcept override;

    static const char *const TEMP_PREFIX;
};

/**
 * @brief Scope guard owning one staged file
 *
 * The staged file is removed when the guard goes out of scope unless
 * commitTo() succeeded. Removal failures are ignored.
 */
class TempArtifact
{
public:
    explicit TempArtifact(ArtifactStore &store) : store_(store) {}
    ~TempArtifact();

    TempArtifact(const TempArtifact &) = delete;
    TempArtifact &operator=(const TempArtifact &) = delete;
    TempArtifact(TempArtifact &&) = delete;
    TempArtifact &operator=(TempArtifact &&) = delete;

    IoStatus create(const std::filesystem::path &directory, const std::string &suffix);
    IoStatus write(const std::vector<uint8_t> &data);
    IoStatus commitTo(const std::filesystem::path &destination);

    const std::filesystem::path &path() const { return path_; }
    bool isCommitted() const { return committed_; }

private:
    ArtifactStore &store_;
    std::filesystem::path path_;
    bool committed_ = false;
};
