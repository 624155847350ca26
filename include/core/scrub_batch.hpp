#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "core/image_scrubber.hpp"
#include "core/scrub_result.hpp"

struct ScrubJob
{
    std::filesystem::path input;
    std::filesystem::path output;
    bool overwrites_input = false; // output resolves to a file of the batch's inputs
};

struct BatchOptions
{
    std::string output;     // explicit output file, single input only
    std::string output_dir; // empty places each output beside its input
    std::string prefix = "scrubbed_";
    int max_input_size_mb = 200;
    int max_workers = 4;
};

/**
 * @brief Batch driver around ImageScrubber
 *
 * Expands directory arguments, assigns every input a distinct output path
 * that never lands on an input, applies the input size ceiling, runs the
 * jobs on a capped TBB pool and folds the results into a process exit code.
 */
class ScrubBatch
{
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_CLIENT_FAULT = 1;
    static constexpr int EXIT_SERVER_FAULT = 2;
    static constexpr int EXIT_USAGE = 64;

    // Directories expand to their supported files in sorted order; other arguments pass through
    static std::vector<std::filesystem::path> expandInputs(const std::vector<std::string> &inputs, bool recursive);

    static std::vector<ScrubJob> planJobs(const std::vector<std::filesystem::path> &inputs,
                                          const BatchOptions &options);

    /**
     * @brief Runs one planned job
     *
     * Jobs whose output is an input file and inputs above the size ceiling
     * fail with InputError before the scrubber sees them.
     */
    static ScrubResult runJob(const ImageScrubber &scrubber, const ScrubJob &job, const BatchOptions &options);

    // Results come back in job order
    static std::vector<ScrubResult> run(const ImageScrubber &scrubber, const std::vector<ScrubJob> &jobs,
                                        const BatchOptions &options);

    /**
     * @brief 0 when every job succeeded, 2 on any server fault, otherwise 1
     */
    static int exitCode(const std::vector<ScrubResult> &results);

    // Appends _1, _2, ... to the stem until the path is not in taken
    static std::filesystem::path uniqueOutputPath(const std::filesystem::path &candidate,
                                                  std::set<std::filesystem::path> &taken);

    // Comparison key for "same file": symlinks and dot segments resolved
    static std::filesystem::path pathKey(const std::filesystem::path &path);
};
