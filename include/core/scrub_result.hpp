#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

/**
 * @brief Outcome kind of a scrub operation
 */
enum class ResultType
{
    SUCCESS,
    ERROR
};

/**
 * @brief Error taxonomy surfaced to operators and clients
 *
 * INPUT_ERROR and PERMISSION_ERROR are client-fault buckets,
 * OUTPUT_ERROR and PROCESSING_ERROR are server-fault buckets.
 */
enum class ErrorCategory
{
    INPUT_ERROR,      // Missing, unsupported, corrupt or unidentifiable input
    PERMISSION_ERROR, // Input not readable or output location not writable
    OUTPUT_ERROR,     // Write-path I/O failure (disk full, read-only fs, EIO)
    PROCESSING_ERROR  // Unexpected decode/encode failure
};

/**
 * @brief Success arm: where the clean file landed and what was stripped
 */
struct ScrubSuccess
{
    std::filesystem::path output_path;
    std::string metadata_removed;
};

/**
 * @brief Error arm: diagnostic, category and remediation hint
 */
struct ScrubError
{
    std::string error;
    ErrorCategory category;
    std::string fix_hint;
};

/**
 * @brief Immutable result of one scrub call
 *
 * Holds exactly one of ScrubSuccess or ScrubError, so a result can never carry
 * an output path together with error fields.
 */
class ScrubResult
{
public:
    using Outcome = std::variant<ScrubSuccess, ScrubError>;

    static const char *const METADATA_REMOVED;

    static ScrubResult success(const std::filesystem::path &input_path,
                               const std::filesystem::path &output_path);

    static ScrubResult failure(const std::filesystem::path &input_path,
                               ErrorCategory category,
                               const std::string &error,
                               const std::string &fix_hint);

    ResultType resultType() const;
    bool isError() const { return resultType() == ResultType::ERROR; }

    const std::filesystem::path &inputPath() const { return input_path_; }
    const Outcome &outcome() const { return outcome_; }

    // Arm accessors, nullptr when the result holds the other arm
    const ScrubSuccess *successValue() const { return std::get_if<ScrubSuccess>(&outcome_); }
    const ScrubError *errorValue() const { return std::get_if<ScrubError>(&outcome_); }

    // Field-style accessors, empty when the field does not apply
    std::optional<std::filesystem::path> outputPath() const;
    std::optional<std::string> metadataRemoved() const;
    std::optional<std::string> error() const;
    std::optional<ErrorCategory> errorCategory() const;
    std::optional<std::string> fixHint() const;

private:
    ScrubResult(std::filesystem::path input_path, Outcome outcome);

    std::filesystem::path input_path_;
    Outcome outcome_;
};

// Wire names: "success"/"error" and "input_error", "permission_error", ...
std::string toString(ResultType type);
std::string toString(ErrorCategory category);

/**
 * @brief Transport status bucket for an error category
 * @return 400, 403, 507 or 500
 */
int httpStatusFor(ErrorCategory category);

bool isClientFault(ErrorCategory category);

/**
 * @brief Boundary representation of a result
 *
 * Success: {status, input, output, metadata_removed}
 * Error:   {status, input, error, category, hint, http_status}
 */
nlohmann::json toJson(const ScrubResult &result);

/**
 * @brief Single-line JSON text that never throws on non-UTF-8 strings
 */
std::string dumpJson(const nlohmann::json &j);
