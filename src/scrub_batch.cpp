#include "core/scrub_batch.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <optional>
#include <utility>

std::vector<fs::path> ScrubBatch::expandInputs(const std::vector<std::string> &inputs, bool recursive)
{
    std::vector<fs::path> expanded;
    for (const auto &input : inputs)
    {
        if (FileUtils::isValidDirectory(input))
        {
            for (const auto &file : FileUtils::listFiles(input, recursive))
            {
                if (ImageScrubber::canHandle(file))
                    expanded.emplace_back(file);
            }
        }
        else
        {
            expanded.emplace_back(input);
        }
    }
    return expanded;
}

fs::path ScrubBatch::pathKey(const fs::path &path)
{
    std::error_code ec;
    fs::path key = fs::weakly_canonical(path, ec);
    if (ec)
        return fs::absolute(path, ec).lexically_normal();
    return key;
}

fs::path ScrubBatch::uniqueOutputPath(const fs::path &candidate, std::set<fs::path> &taken)
{
    fs::path path = candidate;
    for (int n = 1; taken.count(pathKey(path)) > 0; ++n)
    {
        path = candidate.parent_path() /
               (candidate.stem().string() + "_" + std::to_string(n) + candidate.extension().string());
    }
    taken.insert(pathKey(path));
    return path;
}

std::vector<ScrubJob> ScrubBatch::planJobs(const std::vector<fs::path> &inputs, const BatchOptions &options)
{
    std::set<fs::path> input_keys;
    for (const auto &input : inputs)
        input_keys.insert(pathKey(input));

    // Inputs are reserved so no generated name can replace a source image
    std::set<fs::path> taken = input_keys;

    std::vector<ScrubJob> jobs;
    for (const auto &input : inputs)
    {
        ScrubJob job;
        job.input = input;
        if (!options.output.empty())
        {
            job.output = options.output;
        }
        else
        {
            fs::path dir = options.output_dir.empty() ? input.parent_path() : fs::path(options.output_dir);
            job.output = uniqueOutputPath(dir / (options.prefix + input.filename().string()), taken);
        }
        job.overwrites_input = input_keys.count(pathKey(job.output)) > 0;
        jobs.push_back(job);
    }
    return jobs;
}

ScrubResult ScrubBatch::runJob(const ImageScrubber &scrubber, const ScrubJob &job, const BatchOptions &options)
{
    if (job.overwrites_input)
    {
        Logger::warn("Rejected " + job.input.string() + ": output " + job.output.string() + " is an input file");
        return ScrubResult::failure(job.input, ErrorCategory::INPUT_ERROR, "Output path would overwrite an input file",
                                    "Choose a different output path, prefix or directory");
    }

    const uint64_t max_input_bytes = static_cast<uint64_t>(options.max_input_size_mb) * 1024 * 1024;
    auto size = FileUtils::getFileSize(job.input.string());
    if (size && *size > max_input_bytes)
    {
        Logger::warn("Rejected " + job.input.string() + ": " + std::to_string(*size) + " bytes exceeds limit");
        return ScrubResult::failure(job.input, ErrorCategory::INPUT_ERROR, "File too large",
                                    "Maximum file size is " + std::to_string(options.max_input_size_mb) + "MB");
    }
    return scrubber.scrub(job.input, job.output);
}

std::vector<ScrubResult> ScrubBatch::run(const ImageScrubber &scrubber, const std::vector<ScrubJob> &jobs,
                                         const BatchOptions &options)
{
    const size_t workers = static_cast<size_t>(std::max(1, options.max_workers));
    Logger::debug("Scrubbing " + std::to_string(jobs.size()) + " file(s) with up to " + std::to_string(workers) +
                  " worker(s)");

    std::vector<std::optional<ScrubResult>> slots(jobs.size());
    {
        tbb::global_control parallelism(tbb::global_control::max_allowed_parallelism, workers);
        tbb::parallel_for(tbb::blocked_range<size_t>(0, jobs.size()),
                          [&](const tbb::blocked_range<size_t> &range)
                          {
                              for (size_t i = range.begin(); i != range.end(); ++i)
                              {
                                  slots[i] = runJob(scrubber, jobs[i], options);
                              }
                          });
    }

    std::vector<ScrubResult> results;
    results.reserve(slots.size());
    for (auto &slot : slots)
        results.push_back(std::move(*slot));
    return results;
}

int ScrubBatch::exitCode(const std::vector<ScrubResult> &results)
{
    bool client_fault = false;
    bool server_fault = false;
    for (const auto &result : results)
    {
        if (auto category = result.errorCategory())
        {
            if (isClientFault(*category))
                client_fault = true;
            else
                server_fault = true;
        }
    }

    if (server_fault)
        return EXIT_SERVER_FAULT;
    if (client_fault)
        return EXIT_CLIENT_FAULT;
    return EXIT_OK;
}
