#include "cli/application.hpp"

#include "compression/zstd/types.hpp"
#include "engine/archive_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kMaxLevelArgument = static_cast<std::size_t>(arcstream::compression::zstd::kMaxLevel);
constexpr std::size_t kMaxThreads = 1024;

enum class Command {
    Compress,
    Decompress,
    Extract,
    Info,
    Config,
    Help
};

struct Options {
    Command command {Command::Help};
    std::filesystem::path input;
    std::filesystem::path output;
    std::optional<int> level;
    std::optional<std::size_t> chunkSize;
    std::optional<std::size_t> threads;
    std::vector<std::string> excludes;
    std::optional<std::string> password;
    bool computeHash {true};
    bool parallel {true};
    bool verify {true};
    bool stats {false};
    bool verbose {false};
    bool quiet {false};
};

void printUsage()
{
    std::cout << "Usage:\n"
              << "  arcstream compress <input> <output> [-l <1-22>] [-e <pattern>]... [--no-hash] [--no-parallel] [-s]\n"
              << "  arcstream decompress <input> <output> [--no-verify]\n"
              << "  arcstream extract <archive.zip> <output-dir> [-e <pattern>]... [-p <password>] [--no-verify]\n"
              << "  arcstream info <archive>\n"
              << "  arcstream config\n"
              << "  arcstream help\n"
              << "\n"
              << "Common flags:\n"
              << "  -i/--input, -o/--output   alternative to positional paths\n"
              << "  --chunk-size <bytes>      streaming chunk size (default 1 MiB)\n"
              << "  -t/--threads <n>          compression worker threads\n"
              << "  -v/--verbose              debug logging\n"
              << "  -q/--quiet                errors only, no progress output\n"
              << "\n"
              << "Notes:\n"
              << "  - compress accepts a file or a directory; directories are packed and\n"
              << "    restored as <output>/<folder name>/...\n"
              << "  - decompress detects single-file and folder archives on its own.\n"
              << "  - extract exits with 1 when any member could not be extracted.\n";
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

Command parseCommand(const std::string& argument)
{
    const auto lowered = toLower(argument);
    if (lowered == "compress") {
        return Command::Compress;
    }
    if (lowered == "decompress") {
        return Command::Decompress;
    }
    if (lowered == "extract") {
        return Command::Extract;
    }
    if (lowered == "info") {
        return Command::Info;
    }
    if (lowered == "config") {
        return Command::Config;
    }
    if (lowered == "help" || lowered == "--help" || lowered == "-h") {
        return Command::Help;
    }
    throw std::invalid_argument("Unknown command: " + argument);
}

std::size_t parseCount(const std::string& value, const std::string& what, std::size_t maximum)
{
    std::size_t parsed = 0;
    try {
        if (value.empty() || value.front() == '-' || value.front() == '+') {
            throw std::invalid_argument(value);
        }
        std::size_t consumed = 0;
        parsed = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + what + ": " + value);
    }
    if (parsed > maximum) {
        throw std::invalid_argument("Invalid " + what + ": " + value + " (maximum " + std::to_string(maximum) + ")");
    }
    return parsed;
}

Options parseOptions(int argc, char** argv)
{
    Options options {};

    if (argc < 2) {
        return options;
    }

    options.command = parseCommand(argv[1]);
    if (options.command == Command::Help) {
        return options;
    }

    std::vector<std::filesystem::path> positional;
    for (int index = 2; index < argc; ++index) {
        const std::string argument = argv[index];
        const bool hasValue = index + 1 < argc;

        if ((argument == "--input" || argument == "-i") && hasValue) {
            options.input = std::filesystem::path(argv[++index]);
        } else if ((argument == "--output" || argument == "-o") && hasValue) {
            options.output = std::filesystem::path(argv[++index]);
        } else if ((argument == "--level" || argument == "-l") && hasValue) {
            options.level = static_cast<int>(parseCount(argv[++index], "compression level", kMaxLevelArgument));
        } else if (argument == "--chunk-size" && hasValue) {
            options.chunkSize = parseCount(argv[++index], "chunk size", arcstream::engine::kMaxChunkSize);
        } else if ((argument == "--threads" || argument == "-t") && hasValue) {
            options.threads = parseCount(argv[++index], "thread count", kMaxThreads);
        } else if ((argument == "--exclude" || argument == "-e") && hasValue) {
            options.excludes.emplace_back(argv[++index]);
        } else if ((argument == "--password" || argument == "-p") && hasValue) {
            options.password = std::string(argv[++index]);
        } else if (argument == "--no-hash") {
            options.computeHash = false;
        } else if (argument == "--no-parallel") {
            options.parallel = false;
        } else if (argument == "--no-verify") {
            options.verify = false;
        } else if (argument == "--stats" || argument == "-s") {
            options.stats = true;
        } else if (argument == "--verbose" || argument == "-v") {
            options.verbose = true;
        } else if (argument == "--quiet" || argument == "-q") {
            options.quiet = true;
        } else if (argument == "--help" || argument == "-h") {
            options.command = Command::Help;
            return options;
        } else if (!argument.empty() && argument[0] != '-') {
            positional.emplace_back(argument);
        } else {
            throw std::invalid_argument("Unrecognized argument: " + argument);
        }
    }

    auto next = positional.begin();
    if (options.input.empty() && next != positional.end()) {
        options.input = *next++;
    }
    if (options.output.empty() && next != positional.end()) {
        options.output = *next++;
    }
    if (next != positional.end()) {
        throw std::invalid_argument("Unexpected argument: " + next->string());
    }

    if (options.command == Command::Config) {
        return options;
    }
    if (options.input.empty()) {
        throw std::invalid_argument("Missing required input path");
    }
    if (options.output.empty() && options.command != Command::Info) {
        throw std::invalid_argument("Missing required output path");
    }
    return options;
}

void configureLogging(const Options& options)
{
    spdlog::set_pattern("%^%l%$: %v");
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (options.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

arcstream::engine::EngineConfig buildConfig(const Options& options)
{
    arcstream::engine::EngineConfig config;
    if (options.level) {
        config.compressionLevel = *options.level;
    }
    if (options.chunkSize) {
        config.chunkSize = *options.chunkSize;
    }
    if (options.threads) {
        config.parallelThreads = *options.threads;
    }
    config.verifyIntegrity = options.verify;
    config.validate();
    return config;
}

// Chunk events rewrite the current line; everything else gets its own line.
arcstream::engine::ProgressReporter textReporter(const Options& options)
{
    if (options.quiet) {
        return {};
    }

    auto openLine = std::make_shared<bool>(false);
    return arcstream::engine::ProgressReporter([openLine](const arcstream::engine::ProgressEvent& event) {
        const auto text = arcstream::engine::formatProgress(event);
        if (event.stage == arcstream::engine::ProgressStage::Chunk) {
            std::cout << '\r' << text << std::flush;
            *openLine = true;
            return;
        }
        if (*openLine) {
            std::cout << '\n';
            *openLine = false;
        }
        if (!text.empty()) {
            std::cout << text << '\n';
        }
    });
}

void printStats(const arcstream::engine::CompressionResult& result)
{
    char line[128];
    std::cout << "Compression statistics:\n";
    std::cout << "  Original size:   " << result.originalSize << " bytes\n";
    std::cout << "  Compressed size: " << result.compressedSize << " bytes\n";
    std::snprintf(line, sizeof(line), "  Ratio:           %.2f:1\n", result.compressionRatio());
    std::cout << line;
    std::cout << "  Files processed: " << result.filesProcessed << "\n";
    std::snprintf(line, sizeof(line), "  Duration:        %.2fs\n", result.elapsed.count());
    std::cout << line;
    std::snprintf(line, sizeof(line), "  Throughput:      %.2f MB/s\n", result.throughputMiBps());
    std::cout << line;
}

int runCompress(const arcstream::engine::ArchiveEngine& engine, const Options& options)
{
    arcstream::engine::CompressOptions compressOptions;
    compressOptions.level = options.level;
    compressOptions.computeHash = options.computeHash;
    compressOptions.excludePatterns = options.excludes;
    compressOptions.parallel = options.parallel;

    const auto reporter = textReporter(options);
    const auto result = std::filesystem::is_directory(options.input)
        ? engine.compressFolder(options.input, options.output, compressOptions, reporter)
        : engine.compressFile(options.input, options.output, compressOptions, reporter);

    for (const auto& outcome : result.outcomes) {
        std::cerr << arcstream::engine::toString(outcome.status) << " " << outcome.name << ": " << outcome.message
                  << "\n";
    }
    const auto failed = arcstream::engine::countStatus(result.outcomes, arcstream::engine::MemberStatus::Failed);
    if (failed > 0 && !options.quiet) {
        std::cerr << failed << " file(s) could not be added to the archive\n";
    }
    if (options.stats) {
        printStats(result);
    }
    return 0;
}

int runDecompress(const arcstream::engine::ArchiveEngine& engine, const Options& options)
{
    arcstream::engine::DecompressOptions decompressOptions;
    decompressOptions.verifyHash = options.verify;

    const auto result = engine.decompress(options.input, options.output, decompressOptions, textReporter(options));
    if (!options.quiet) {
        std::cout << "Extracted " << result.extractedCount << " file(s) to " << result.output.string()
                  << " (integrity " << arcstream::engine::toString(result.integrity) << ")\n";
    }
    for (const auto status : {arcstream::engine::MemberStatus::Rejected, arcstream::engine::MemberStatus::Failed,
                              arcstream::engine::MemberStatus::Skipped}) {
        const auto count = arcstream::engine::countStatus(result.outcomes, status);
        if (count > 0) {
            std::cerr << count << " member(s) " << arcstream::engine::toString(status) << "\n";
        }
    }
    return result.success ? 0 : 1;
}

int runExtract(const arcstream::engine::ArchiveEngine& engine, const Options& options)
{
    arcstream::engine::ZipOptions zipOptions;
    zipOptions.excludePatterns = options.excludes;
    zipOptions.password = options.password;
    zipOptions.verifyIntegrity = options.verify;

    const auto result = engine.extractZip(options.input, options.output, zipOptions, textReporter(options));
    if (result.succeeded()) {
        return 0;
    }

    std::cerr << "Extraction completed with errors. Failed to extract " << result.failures.size() << " files:\n";
    for (const auto& line : arcstream::engine::summarizeFailures(result.failures)) {
        std::cerr << line << "\n";
    }
    return 1;
}

int runInfo(const arcstream::engine::ArchiveEngine& engine, const Options& options)
{
    const auto info = engine.inspect(options.input);
    std::cout << "Archive:         " << info.path.string() << "\n"
              << "Size:            " << info.compressedSize << " bytes\n"
              << "Payload:         " << (info.kind ? arcstream::compression::zstd::toString(*info.kind) : "unknown")
              << (info.tagged ? " (tagged)" : " (detected)") << "\n";
    if (info.sidecar) {
        std::cout << "SHA-256:         " << info.sidecar->digest << "\n"
                  << "Original name:   " << info.sidecar->originalName << "\n";
    } else {
        std::cout << "SHA-256:         none\n";
    }
    return 0;
}

int runConfig(const arcstream::engine::ArchiveEngine& engine)
{
    const auto& config = engine.config();
    std::cout << "chunk_size:        " << config.chunkSize << "\n"
              << "compression_level: " << config.compressionLevel << "\n"
              << "verify_integrity:  " << (config.verifyIntegrity ? "true" : "false") << "\n"
              << "parallel_threads:  " << config.parallelThreads << "\n";
    return 0;
}

} // namespace

namespace arcstream::cli {

int run(int argc, char** argv)
{
    try {
        const auto options = parseOptions(argc, argv);
        configureLogging(options);

        if (options.command == Command::Help) {
            printUsage();
            return 0;
        }

        const engine::ArchiveEngine engine(buildConfig(options));

        switch (options.command) {
        case Command::Compress:
            return runCompress(engine, options);
        case Command::Decompress:
            return runDecompress(engine, options);
        case Command::Extract:
            return runExtract(engine, options);
        case Command::Info:
            return runInfo(engine, options);
        case Command::Config:
            return runConfig(engine);
        case Command::Help:
            break;
        }

        printUsage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace arcstream::cli
