#include "core/scrub_result.hpp"

#include <utility>

const char *const ScrubResult::METADATA_REMOVED = "EXIF / IPTC / XMP metadata";

ScrubResult::ScrubResult(std::filesystem::path input_path, Outcome outcome)
    : input_path_(std::move(input_path)), outcome_(std::move(outcome))
{
}

ScrubResult ScrubResult::success(const std::filesystem::path &input_path,
                                 const std::filesystem::path &output_path)
{
    return ScrubResult(input_path, ScrubSuccess{output_path, METADATA_REMOVED});
}

ScrubResult ScrubResult::failure(const std::filesystem::path &input_path,
                                 ErrorCategory category,
                                 const std::string &error,
                                 const std::string &fix_hint)
{
    return ScrubResult(input_path, ScrubError{error, category, fix_hint});
}

ResultType ScrubResult::resultType() const
{
    return std::holds_alternative<ScrubError>(outcome_) ? ResultType::ERROR : ResultType::SUCCESS;
}

std::optional<std::filesystem::path> ScrubResult::outputPath() const
{
    if (const auto *ok = successValue())
        return ok->output_path;
    return std::nullopt;
}

std::optional<std::string> ScrubResult::metadataRemoved() const
{
    if (const auto *ok = successValue())
        return ok->metadata_removed;
    return std::nullopt;
}

std::optional<std::string> ScrubResult::error() const
{
    if (const auto *err = errorValue())
        return err->error;
    return std::nullopt;
}

std::optional<ErrorCategory> ScrubResult::errorCategory() const
{
    if (const auto *err = errorValue())
        return err->category;
    return std::nullopt;
}

std::optional<std::string> ScrubResult::fixHint() const
{
    if (const auto *err = errorValue())
        return err->fix_hint;
    return std::nullopt;
}

std::string toString(ResultType type)
{
    switch (type)
    {
    case ResultType::SUCCESS:
        return "success";
    case ResultType::ERROR:
        return "error";
    }
    return "error";
}

std::string toString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::INPUT_ERROR:
        return "input_error";
    case ErrorCategory::PERMISSION_ERROR:
        return "permission_error";
    case ErrorCategory::OUTPUT_ERROR:
        return "output_error";
    case ErrorCategory::PROCESSING_ERROR:
        return "processing_error";
    }
    return "processing_error";
}

int httpStatusFor(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::INPUT_ERROR:
        return 400;
    case ErrorCategory::PERMISSION_ERROR:
        return 403;
    case ErrorCategory::OUTPUT_ERROR:
        return 507; // Insufficient Storage
    case ErrorCategory::PROCESSING_ERROR:
        return 500;
    }
    return 500;
}

bool isClientFault(ErrorCategory category)
{
    return category == ErrorCategory::INPUT_ERROR || category == ErrorCategory::PERMISSION_ERROR;
}

nlohmann::json toJson(const ScrubResult &result)
{
    nlohmann::json j;
    j["status"] = toString(result.resultType());
    j["input"] = result.inputPath().string();

    if (const auto *ok = result.successValue())
    {
        j["output"] = ok->output_path.string();
        j["metadata_removed"] = ok->metadata_removed;
    }
    else if (const auto *err = result.errorValue())
    {
        j["error"] = err->error;
        j["category"] = toString(err->category);
        j["hint"] = err->fix_hint;
        j["http_status"] = httpStatusFor(err->category);
    }
    return j;
}

std::string dumpJson(const nlohmann::json &j)
{
    // Paths are raw bytes on POSIX; invalid UTF-8 becomes U+FFFD instead of throwing
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
