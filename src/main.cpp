#include "core/container_inspector.hpp"
#include "core/file_utils.hpp"
#include "core/image_scrubber.hpp"
#include "core/scrub_batch.hpp"
#include "core/scrub_config_manager.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace
{
    const char *VERSION = "1.0.0";

    struct CommandLine
    {
        std::vector<std::string> inputs;
        std::string output;
        std::string output_dir;
        std::string config_path;
        std::string log_level;
        bool json = false;
        bool inspect = false;
        bool recursive = false;
        bool list_formats = false;
        bool help = false;
        bool version = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "metascrub - remove EXIF / IPTC / XMP metadata from images" << std::endl;
        std::cout << "Usage: " << program << " [options] <input>..." << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --output, -o <path>      Output file (single input only)" << std::endl;
        std::cout << "  --output-dir, -d <dir>   Directory for scrubbed files" << std::endl;
        std::cout << "  --config, -c <file>      YAML configuration file" << std::endl;
        std::cout << "  --json, -j               Print one JSON object per result" << std::endl;
        std::cout << "  --log-level, -l <level>  TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --recursive, -r          Descend into directory inputs" << std::endl;
        std::cout << "  --inspect, -i            List metadata blocks without scrubbing" << std::endl;
        std::cout << "  --formats, -f            Print supported extensions" << std::endl;
        std::cout << "  --version, -v            Print version" << std::endl;
        std::cout << "  --help, -h               Show this help message" << std::endl;
    }

    bool parseArguments(int argc, char *argv[], CommandLine &cmd, std::string &error)
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];

            auto takeValue = [&](std::string &target) -> bool
            {
                if (i + 1 >= argc)
                {
                    error = "Option " + arg + " requires a value";
                    return false;
                }
                target = argv[++i];
                return true;
            };

            if (arg == "--output" || arg == "-o")
            {
                if (!takeValue(cmd.output))
                    return false;
            }
            else if (arg == "--output-dir" || arg == "-d")
            {
                if (!takeValue(cmd.output_dir))
                    return false;
            }
            else if (arg == "--config" || arg == "-c")
            {
                if (!takeValue(cmd.config_path))
                    return false;
            }
            else if (arg == "--log-level" || arg == "-l")
            {
                if (!takeValue(cmd.log_level))
                    return false;
            }
            else if (arg == "--json" || arg == "-j")
                cmd.json = true;
            else if (arg == "--recursive" || arg == "-r")
                cmd.recursive = true;
            else if (arg == "--inspect" || arg == "-i")
                cmd.inspect = true;
            else if (arg == "--formats" || arg == "-f")
                cmd.list_formats = true;
            else if (arg == "--version" || arg == "-v")
                cmd.version = true;
            else if (arg == "--help" || arg == "-h")
                cmd.help = true;
            else if (arg.size() > 1 && arg[0] == '-')
            {
                error = "Unknown option: " + arg;
                return false;
            }
            else
                cmd.inputs.push_back(arg);
        }
        return true;
    }

    void report(const ScrubResult &result, bool json)
    {
        if (json)
        {
            std::cout << dumpJson(toJson(result)) << std::endl;
            return;
        }

        if (const auto *ok = result.successValue())
        {
            std::cout << "OK    " << result.inputPath().string() << " -> " << ok->output_path.string()
                      << " (removed " << ok->metadata_removed << ")" << std::endl;
        }
        else if (const auto *err = result.errorValue())
        {
            std::cout << "FAIL  " << result.inputPath().string() << ": " << err->error << " ["
                      << toString(err->category) << "]" << std::endl;
            std::cout << "      hint: " << err->fix_hint << std::endl;
        }
    }

    int inspect(const std::vector<fs::path> &inputs, bool json)
    {
        int exit_code = 0;
        for (const auto &input : inputs)
        {
            auto format = ContainerInspector::detectFileFormat(input.string());
            auto blocks = ContainerInspector::inspectFile(input.string());
            if (!format || !blocks)
            {
                std::cerr << "Cannot read " << input.string() << std::endl;
                exit_code = ScrubBatch::EXIT_CLIENT_FAULT;
                continue;
            }

            if (json)
            {
                nlohmann::json j;
                j["input"] = input.string();
                j["format"] = ContainerInspector::formatName(*format);
                j["metadata"] = nlohmann::json::array();
                for (const auto &block : *blocks)
                {
                    j["metadata"].push_back({{"kind", ContainerInspector::kindName(block.kind)},
                                             {"label", block.label},
                                             {"offset", block.offset},
                                             {"size", block.size}});
                }
                std::cout << dumpJson(j) << std::endl;
                continue;
            }

            std::cout << input.string() << " (" << ContainerInspector::formatName(*format) << "): "
                      << blocks->size() << " metadata block(s)" << std::endl;
            for (const auto &block : *blocks)
            {
                std::cout << "  " << ContainerInspector::kindName(block.kind) << "  " << block.label
                          << " @" << block.offset << " (" << block.size << " bytes)" << std::endl;
            }
        }
        return exit_code;
    }
}

int main(int argc, char *argv[])
{
    CommandLine cmd;
    std::string parse_error;
    if (!parseArguments(argc, argv, cmd, parse_error))
    {
        std::cerr << "Error: " << parse_error << std::endl;
        std::cerr << "Use --help or -h for more options." << std::endl;
        return ScrubBatch::EXIT_USAGE;
    }

    if (cmd.help)
    {
        printUsage(argv[0]);
        return 0;
    }
    if (cmd.version)
    {
        std::cout << "metascrub " << VERSION << std::endl;
        return 0;
    }
    if (cmd.list_formats)
    {
        for (const auto &extension : ImageScrubber::getSupportedExtensions())
            std::cout << extension << std::endl;
        return 0;
    }

    auto &config = ScrubConfigManager::getInstance();
    if (!cmd.config_path.empty() && !config.loadConfig(cmd.config_path))
    {
        std::cerr << "Error: could not load configuration from " << cmd.config_path << std::endl;
        return ScrubBatch::EXIT_USAGE;
    }
    if (!cmd.log_level.empty())
        config.setLogLevel(cmd.log_level);
    if (!cmd.output_dir.empty())
        config.setOutputDirectory(cmd.output_dir);

    Logger::init(config.getLogLevel(), config.getLogFile());

    if (cmd.inputs.empty())
    {
        std::cerr << "Error: no input files given" << std::endl;
        std::cerr << "Use --help or -h for more options." << std::endl;
        return ScrubBatch::EXIT_USAGE;
    }

    const std::vector<fs::path> inputs = ScrubBatch::expandInputs(cmd.inputs, cmd.recursive);
    if (inputs.empty())
    {
        std::cerr << "Error: no supported images found in the given inputs" << std::endl;
        return ScrubBatch::EXIT_CLIENT_FAULT;
    }

    if (cmd.inspect)
        return inspect(inputs, cmd.json);

    if (!cmd.output.empty() && inputs.size() > 1)
    {
        std::cerr << "Error: --output accepts a single input; use --output-dir for several" << std::endl;
        return ScrubBatch::EXIT_USAGE;
    }

    BatchOptions options;
    options.output = cmd.output;
    options.output_dir = config.getOutputDirectory();
    options.prefix = config.getOutputPrefix();
    options.max_input_size_mb = config.getMaxInputSizeMB();
    options.max_workers = config.getMaxWorkers();

    ImageScrubber scrubber;
    const std::vector<ScrubResult> results = ScrubBatch::run(scrubber, ScrubBatch::planJobs(inputs, options), options);

    for (const auto &result : results)
        report(result, cmd.json);

    return ScrubBatch::exitCode(results);
}
