#include "engine/archive_engine.hpp"

#include "archive/zip_extractor.hpp"
#include "compression/zstd/codec.hpp"
#include "compression/zstd/format_tag.hpp"
#include "compression/zstd/stream_buffer.hpp"
#include "concurrency/thread_pool.hpp"
#include "container/packer.hpp"
#include "container/sniffer.hpp"
#include "container/unpacker.hpp"
#include "filesystem/resource_context.hpp"
#include "integrity/hash_verifier.hpp"
#include "security/path_guard.hpp"
#include "utils/errors.hpp"
#include "utils/file_io.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <limits>
#include <optional>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace arcstream::engine {

namespace {

using compression::zstd::PayloadKind;
using Clock = std::chrono::steady_clock;

constexpr const char* kCompressOperation = "compress";
constexpr const char* kDecompressOperation = "decompress";
constexpr const char* kFallbackFolderName = "archive";

std::uint64_t fileSizeOrThrow(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("file_size", path, ec);
    }
    return size;
}

std::uint32_t toMode(std::filesystem::perms permissions, std::uint32_t fallback)
{
    if (permissions == std::filesystem::perms::unknown) {
        return fallback;
    }
    return static_cast<std::uint32_t>(permissions & std::filesystem::perms::mask);
}

void closeOutput(std::ofstream& output, const std::filesystem::path& path)
{
    output.close();
    if (!output) {
        throw std::runtime_error("Failed to finalize output file: " + path.string());
    }
}

std::string folderNameOf(const std::filesystem::path& canonical)
{
    auto name = canonical.filename().string();
    if (name.empty() || name == "." || name == "..") {
        spdlog::debug("Source folder {} has no usable name, storing entries under {}", canonical.string(),
                      kFallbackFolderName);
        return kFallbackFolderName;
    }
    return name;
}

// Undoes the extraction of a record the writer flagged as ending early.
void discardIncomplete(const std::string& name,
                       const std::optional<std::filesystem::path>& written,
                       const ProgressReporter& reporter,
                       DecompressionResult& result)
{
    const auto message = std::string("content ended early when the archive was written");
    spdlog::warn("Discarding {}: {}", name, message);
    reporter.warning(kDecompressOperation, "Discarding " + name + ": " + message);

    if (result.outcomes.empty() || result.outcomes.back().name != name) {
        result.outcomes.push_back({name, MemberStatus::Failed, message});
        return;
    }

    auto& previous = result.outcomes.back();
    if (written && previous.status == MemberStatus::Extracted) {
        std::error_code ec;
        std::filesystem::remove(*written, ec);
        --result.extractedCount;
        previous.status = MemberStatus::Failed;
        previous.message = message;
    }
}

} // namespace

ArchiveEngine::ArchiveEngine(EngineConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

const EngineConfig& ArchiveEngine::config() const noexcept
{
    return config_;
}

std::size_t ArchiveEngine::codecThreads(bool parallel) const noexcept
{
    return parallel && config_.parallelThreads > 1 ? config_.parallelThreads : 0;
}

CompressionResult ArchiveEngine::compressFile(const std::filesystem::path& source,
                                              const std::filesystem::path& destination,
                                              const CompressOptions& options,
                                              const ProgressReporter& reporter) const
{
    CompressionJob job;
    job.source = source;
    job.destination = destination;
    job.level = options.level.value_or(config_.compressionLevel);
    job.chunkSize = config_.chunkSize;
    job.computeHash = options.computeHash;

    return runFileJob(job, codecThreads(options.parallel), reporter);
}

CompressionResult ArchiveEngine::runFileJob(const CompressionJob& job,
                                            std::size_t workerThreads,
                                            const ProgressReporter& reporter) const
{
    if (job.source.empty() || job.destination.empty()) {
        throw std::invalid_argument("Source and destination paths must not be empty");
    }
    compression::zstd::validateLevel(job.level);
    if (job.chunkSize == 0 || job.chunkSize > kMaxChunkSize) {
        throw std::invalid_argument("Chunk size must be between 1 and " + std::to_string(kMaxChunkSize) + " bytes");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(job.source, ec)) {
        const auto message = job.source.string() + " does not exist.";
        spdlog::error(message);
        throw CompressionError(message);
    }

    spdlog::info("Compressing {} with level {}", job.source.string(), job.level);
    const auto started = Clock::now();
    CompressionResult result;

    try {
        utils::PartialOutputGuard guard;
        const filesystem::FileContext file(job.source);
        result.originalSize = file.descriptor().size;
        reporter.started(kCompressOperation, "Compressing " + job.source.filename().string() + "...",
                         result.originalSize);

        if (job.computeHash) {
            spdlog::debug("Hashing {}", job.source.string());
            reporter.started(kCompressOperation, "Calculating input file hash...");
            result.digest = integrity::digestFile(job.source, integrity::HashAlgorithm::Sha256, job.chunkSize);
        }

        spdlog::debug("Streaming {} to {}", job.source.string(), job.destination.string());
        auto output = utils::openOutputFile(job.destination);
        guard.track(job.destination);
        compression::zstd::writeFormatTag(output, PayloadKind::SingleFile);

        auto input = file.open();
        std::uint64_t processed = 0;
        compression::zstd::compressStream(input, output, job.level, job.chunkSize, workerThreads,
                                          [&](std::size_t consumed) {
                                              processed += consumed;
                                              reporter.chunk(kCompressOperation, processed, result.originalSize);
                                          });

        spdlog::debug("Finalizing {}", job.destination.string());
        closeOutput(output, job.destination);
        result.compressedSize = fileSizeOrThrow(job.destination);

        if (result.digest) {
            const auto sidecar = integrity::sidecarPathFor(job.destination);
            guard.track(sidecar);
            integrity::writeSidecar({*result.digest, job.source.filename().string()}, sidecar);
        }

        guard.commit();
    } catch (const CompressionError& ex) {
        spdlog::error("Compression failed: {}", ex.what());
        throw;
    } catch (const std::exception& ex) {
        spdlog::error("Compression failed: {}", ex.what());
        throw CompressionError(std::string("Compression failed: ") + ex.what());
    }

    result.filesProcessed = 1;
    result.elapsed = Clock::now() - started;

    reporter.completed(kCompressOperation, "Compression completed successfully.");
    spdlog::info("Compressed {} -> {}: {} -> {} bytes, ratio {:.2f}:1 in {:.2f}s", job.source.string(),
                 job.destination.string(), result.originalSize, result.compressedSize, result.compressionRatio(),
                 result.elapsed.count());
    return result;
}

CompressionResult ArchiveEngine::compressFolder(const std::filesystem::path& source,
                                                const std::filesystem::path& destination,
                                                const CompressOptions& options,
                                                const ProgressReporter& reporter) const
{
    if (source.empty() || destination.empty()) {
        throw std::invalid_argument("Source and destination paths must not be empty");
    }
    const auto level = options.level.value_or(config_.compressionLevel);
    compression::zstd::validateLevel(level);

    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec)) {
        const auto message = source.string() + " is not a valid directory.";
        spdlog::error(message);
        throw CompressionError(message);
    }

    spdlog::info("Compressing folder {} with level {}", source.string(), level);
    const auto started = Clock::now();
    CompressionResult result;

    try {
        utils::PartialOutputGuard guard;
        const filesystem::DirectoryContext directory(source);
        const auto folderName = folderNameOf(directory.root());
        const auto entries = directory.listEntries(options.excludePatterns, true);

        std::uint64_t totalFiles = 0;
        for (const auto& entry : entries) {
            if (entry.type == filesystem::EntryType::File) {
                ++totalFiles;
                result.originalSize += entry.size;
            }
        }
        reporter.started(kCompressOperation, "Found " + std::to_string(totalFiles) + " files ("
                                                 + std::to_string(result.originalSize) + " bytes)",
                         totalFiles);

        auto output = utils::openOutputFile(destination);
        guard.track(destination);
        compression::zstd::writeFormatTag(output, PayloadKind::Container);

        compression::zstd::CompressingStreamBuf buffer(output, level, codecThreads(options.parallel),
                                                       config_.chunkSize);
        std::ostream sink(&buffer);
        sink.exceptions(std::ios::badbit);
        container::ContainerPacker packer(sink, config_.chunkSize);

        container::ContainerEntry rootEntry;
        rootEntry.path = folderName;
        rootEntry.type = container::EntryType::Directory;
        rootEntry.mode = 0755;
        packer.addDirectory(rootEntry);

        std::uint64_t visited = 0;
        for (const auto& descriptor : entries) {
            const auto name = folderName + "/" + descriptor.relativePath.generic_string();

            if (!descriptor.error.empty()) {
                spdlog::warn("Skipping unreadable directory {}: {}", descriptor.absolutePath.string(),
                             descriptor.error);
                reporter.warning(kCompressOperation, "Could not read " + name + ": " + descriptor.error);
                result.outcomes.push_back({name, MemberStatus::Failed, "cannot list directory: " + descriptor.error});
                continue;
            }

            if (descriptor.type == filesystem::EntryType::Directory) {
                container::ContainerEntry entry;
                entry.path = name;
                entry.type = container::EntryType::Directory;
                entry.mode = toMode(descriptor.permissions, 0755);
                entry.modifiedTime = filesystem::toUnixTime(descriptor.lastWriteTime);
                packer.addDirectory(entry);
                continue;
            }

            if (descriptor.type != filesystem::EntryType::File) {
                spdlog::warn("Skipping {}: not a regular file", descriptor.absolutePath.string());
                reporter.warning(kCompressOperation, "Skipped " + name + " (not a regular file)");
                result.outcomes.push_back({name, MemberStatus::Skipped, "not a regular file"});
                continue;
            }

            container::ContainerEntry entry;
            entry.path = name;
            entry.size = descriptor.size;
            entry.mode = toMode(descriptor.permissions, 0644);
            entry.modifiedTime = filesystem::toUnixTime(descriptor.lastWriteTime);

            try {
                auto input = utils::openInputFile(descriptor.absolutePath);
                packer.addFile(entry, input);
                ++result.filesProcessed;
            } catch (const ArchiveError&) {
                throw;
            } catch (const std::ios_base::failure&) {
                throw;
            } catch (const std::exception& ex) {
                spdlog::warn("Failed to add {}: {}", descriptor.absolutePath.string(), ex.what());
                reporter.warning(kCompressOperation, "Failed to add " + name + ": " + ex.what());
                result.outcomes.push_back({name, MemberStatus::Failed, ex.what()});
            }

            reporter.chunk(kCompressOperation, ++visited, totalFiles);
        }

        packer.finish();
        buffer.finish();
        closeOutput(output, destination);
        result.compressedSize = fileSizeOrThrow(destination);

        guard.commit();

        reporter.completed(kCompressOperation, "Processed " + std::to_string(result.filesProcessed) + "/"
                                                   + std::to_string(totalFiles) + " files");
    } catch (const CompressionError& ex) {
        spdlog::error("Folder compression failed: {}", ex.what());
        throw;
    } catch (const std::exception& ex) {
        spdlog::error("Folder compression failed: {}", ex.what());
        throw CompressionError(std::string("Folder compression failed: ") + ex.what());
    }

    result.elapsed = Clock::now() - started;
    spdlog::info("Compressed folder {} -> {}: {} files, {} -> {} bytes, ratio {:.2f}:1 in {:.2f}s",
                 source.string(), destination.string(), result.filesProcessed, result.originalSize,
                 result.compressedSize, result.compressionRatio(), result.elapsed.count());
    return result;
}

PayloadKind ArchiveEngine::detectKind(const std::filesystem::path& source, bool& tagged) const
{
    if (const auto tag = compression::zstd::readFormatTag(source)) {
        tagged = true;
        spdlog::debug("{} carries a format tag: {}", source.string(), compression::zstd::toString(*tag));
        return *tag;
    }

    tagged = false;
    try {
        auto input = utils::openInputFile(source);
        const auto sample = compression::zstd::peekDecompressed(input, container::kSniffWindow);
        const auto kind = container::classify(sample);
        spdlog::debug("{} has no format tag, sniffed as {}", source.string(), compression::zstd::toString(kind));
        return kind;
    } catch (const std::exception& ex) {
        spdlog::debug("Format detection error for {}: {}", source.string(), ex.what());
        return PayloadKind::SingleFile;
    }
}

DecompressionResult ArchiveEngine::decompress(const std::filesystem::path& source,
                                              const std::filesystem::path& destination,
                                              const DecompressOptions& options,
                                              const ProgressReporter& reporter) const
{
    if (source.empty() || destination.empty()) {
        throw std::invalid_argument("Source and destination paths must not be empty");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        const auto message = source.string() + " does not exist.";
        spdlog::error(message);
        throw ExtractionError(message);
    }

    spdlog::info("Extracting {}", source.string());
    const auto started = Clock::now();

    DecompressionResult result;
    try {
        result.kind = detectKind(source, result.tagged);
        reporter.started(kDecompressOperation, "Decompressing " + source.filename().string() + "...",
                         fileSizeOrThrow(source));

        if (result.kind == PayloadKind::Container) {
            reporter.started(kDecompressOperation, "Detected folder archive");
            decompressContainer(source, destination, reporter, result);
        } else {
            decompressSingle(source, destination, options, reporter, result);
        }
    } catch (const ExtractionError& ex) {
        spdlog::error("Decompression failed: {}", ex.what());
        throw;
    } catch (const std::exception& ex) {
        spdlog::error("Decompression failed: {}", ex.what());
        throw ExtractionError(std::string("Decompression failed: ") + ex.what());
    }

    result.success = true;
    result.elapsed = Clock::now() - started;

    reporter.completed(kDecompressOperation, "Decompression completed successfully.");
    spdlog::info("Decompression completed: {} -> {} ({} files, integrity {})", source.string(),
                 result.output.string(), result.extractedCount, toString(result.integrity));
    return result;
}

void ArchiveEngine::decompressSingle(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     const DecompressOptions& options,
                                     const ProgressReporter& reporter,
                                     DecompressionResult& result) const
{
    std::error_code ec;
    result.output = std::filesystem::is_directory(destination, ec) ? destination / source.stem() : destination;

    std::optional<integrity::SidecarDigest> expected;
    if (options.verifyHash) {
        try {
            expected = integrity::readSidecar(integrity::sidecarPathFor(source));
            if (expected) {
                reporter.started(kDecompressOperation, "Found integrity hash file");
            }
        } catch (const std::exception& ex) {
            spdlog::warn("Could not read hash file: {}", ex.what());
            result.integrity = IntegrityStatus::Unavailable;
            result.warnings.push_back(std::string("Could not read hash file: ") + ex.what());
        }
    }

    const auto compressedSize = fileSizeOrThrow(source);
    std::optional<integrity::HashVerifier> hasher;
    if (expected) {
        hasher.emplace(integrity::HashAlgorithm::Sha256);
    }

    {
        utils::PartialOutputGuard guard;
        auto input = utils::openInputFile(source);
        compression::zstd::StreamDecompressor decompressor(input, config_.chunkSize);

        auto output = utils::openOutputFile(result.output);
        guard.track(result.output);

        std::vector<char> buffer(config_.chunkSize);
        while (const auto got = decompressor.read(buffer.data(), buffer.size())) {
            output.write(buffer.data(), static_cast<std::streamsize>(got));
            if (!output) {
                throw ExtractionError("Failed to write decompressed data to " + result.output.string());
            }
            if (hasher) {
                hasher->update(buffer.data(), got);
            }
            reporter.chunk(kDecompressOperation, decompressor.bytesIn(), compressedSize);
        }

        closeOutput(output, result.output);
        guard.commit();
    }
    result.extractedCount = 1;

    if (!hasher) {
        return;
    }

    reporter.started(kDecompressOperation, "Verifying file integrity...");
    if (integrity::digestsMatch(expected->digest, hasher->finish())) {
        result.integrity = IntegrityStatus::Verified;
        reporter.completed(kDecompressOperation, "File integrity verified");
    } else {
        result.integrity = IntegrityStatus::Mismatch;
        spdlog::warn("Hash verification failed for {}", result.output.string());
        reporter.warning(kDecompressOperation, "File integrity check failed!");
        result.warnings.emplace_back("File integrity check failed");
    }
}

void ArchiveEngine::decompressContainer(const std::filesystem::path& source,
                                        const std::filesystem::path& destination,
                                        const ProgressReporter& reporter,
                                        DecompressionResult& result) const
{
    result.output = destination;

    std::error_code ec;
    const bool existed = std::filesystem::exists(destination, ec);

    utils::PartialOutputGuard guard;
    if (!existed) {
        guard.track(destination);
    }
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        throw ExtractionError("Failed to create output directory " + destination.string() + ": " + ec.message());
    }

    security::PathGuard pathGuard(destination);
    auto input = utils::openInputFile(source);
    compression::zstd::DecompressingStreamBuf buffer(input, config_.chunkSize);
    std::istream stream(&buffer);
    stream.exceptions(std::ios::badbit);
    container::ContainerUnpacker unpacker(stream);

    container::ContainerEntry entry;
    std::vector<char> chunk(config_.chunkSize);
    std::uint64_t processed = 0;

    std::optional<std::filesystem::path> lastWritten;
    while (true) {
        const bool more = unpacker.next(entry);
        if (const auto incomplete = unpacker.takeIncomplete()) {
            discardIncomplete(*incomplete, lastWritten, reporter, result);
        }
        lastWritten.reset();
        if (!more) {
            break;
        }

        reporter.chunk(kDecompressOperation, ++processed, 0);

        const auto target = pathGuard.resolve(entry.path);
        if (!target) {
            reporter.warning(kDecompressOperation, "Skipping unsafe path: " + entry.path);
            result.outcomes.push_back({entry.path, MemberStatus::Rejected, "path escapes the output directory"});
            continue;
        }

        if (entry.type == container::EntryType::Directory) {
            std::filesystem::create_directories(*target, ec);
            if (ec) {
                spdlog::warn("Failed to create {}: {}", target->string(), ec.message());
                result.outcomes.push_back({entry.path, MemberStatus::Failed, ec.message()});
            }
            continue;
        }

        if (entry.type != container::EntryType::File) {
            spdlog::warn("Skipping {}: unsupported entry type", entry.path);
            result.outcomes.push_back({entry.path, MemberStatus::Skipped, "unsupported entry type"});
            continue;
        }

        try {
            auto output = utils::openOutputFile(*target);
            if (existed) {
                guard.track(*target);
            }
            while (const auto got = unpacker.read(chunk.data(), chunk.size())) {
                output.write(chunk.data(), static_cast<std::streamsize>(got));
                if (!output) {
                    throw std::runtime_error("Failed to write " + target->string());
                }
            }
            closeOutput(output, *target);
            ++result.extractedCount;
            result.outcomes.push_back({entry.path, MemberStatus::Extracted, {}});
            lastWritten = *target;
        } catch (const ExtractionError&) {
            throw;
        } catch (const std::ios_base::failure&) {
            throw;
        } catch (const std::exception& ex) {
            spdlog::warn("Failed to extract {}: {}", entry.path, ex.what());
            std::filesystem::remove(*target, ec);
            reporter.warning(kDecompressOperation, "Failed to extract " + entry.path + ": " + ex.what());
            result.outcomes.push_back({entry.path, MemberStatus::Failed, ex.what()});
        }
    }

    // Consume the rest of the frame so a truncated stream is still reported.
    stream.ignore(std::numeric_limits<std::streamsize>::max());

    guard.commit();
    reporter.completed(kDecompressOperation, "Extracted " + std::to_string(result.extractedCount) + " files");
}

ZipExtractionResult ArchiveEngine::extractZip(const std::filesystem::path& archive,
                                              const std::filesystem::path& outputRoot,
                                              const ZipOptions& options,
                                              const ProgressReporter& reporter) const
{
    if (archive.empty() || outputRoot.empty()) {
        throw std::invalid_argument("Archive and output paths must not be empty");
    }

    spdlog::info("Starting extraction of {}", archive.string());

    auto effective = options;
    effective.verifyIntegrity = options.verifyIntegrity && config_.verifyIntegrity;

    ZipExtractionResult result;
    try {
        archive::ZipExtractor extractor(archive);
        result = extractor.extractAll(outputRoot, effective, reporter, config_.chunkSize);
    } catch (const ExtractionError& ex) {
        spdlog::error("ZIP extraction failed: {}", ex.what());
        throw;
    } catch (const std::exception& ex) {
        spdlog::error("ZIP extraction failed: {}", ex.what());
        throw ExtractionError(std::string("ZIP extraction failed: ") + ex.what());
    }

    if (!result.succeeded()) {
        spdlog::warn("Failed to extract {} files", result.failures.size());
        for (const auto& line : summarizeFailures(result.failures)) {
            spdlog::warn(line);
        }
    }
    spdlog::info("Extracted {}/{} files from {}", result.extractedCount, result.totalMembers, archive.string());
    return result;
}

std::vector<BatchOutcome> ArchiveEngine::compressFiles(const std::vector<CompressionJob>& jobs,
                                                       std::size_t threadCount) const
{
    std::vector<BatchOutcome> outcomes;
    if (jobs.empty()) {
        return outcomes;
    }

    concurrency::ThreadPool pool(threadCount == 0 ? config_.parallelThreads : threadCount);
    std::vector<std::future<CompressionResult>> futures;
    futures.reserve(jobs.size());

    for (const auto& job : jobs) {
        futures.push_back(pool.enqueue([this, job]() { return runFileJob(job, 0, ProgressReporter {}); }));
    }

    outcomes.reserve(jobs.size());
    for (std::size_t index = 0; index < jobs.size(); ++index) {
        BatchOutcome outcome;
        outcome.job = jobs[index];
        try {
            outcome.result = futures[index].get();
        } catch (const std::exception& ex) {
            outcome.error = ex.what();
        }
        outcomes.push_back(std::move(outcome));
    }

    const auto succeeded = static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(), [](const BatchOutcome& outcome) {
            return outcome.result.has_value();
        }));
    spdlog::info("Batch compression finished: {} of {} jobs succeeded", succeeded, outcomes.size());
    return outcomes;
}

ArchiveInfo ArchiveEngine::inspect(const std::filesystem::path& archive) const
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(archive, ec)) {
        throw ExtractionError(archive.string() + " does not exist.");
    }

    ArchiveInfo info;
    info.path = archive;
    info.compressedSize = fileSizeOrThrow(archive);
    info.kind = detectKind(archive, info.tagged);

    try {
        info.sidecar = integrity::readSidecar(integrity::sidecarPathFor(archive));
    } catch (const std::exception& ex) {
        spdlog::warn("Could not read hash file: {}", ex.what());
    }
    return info;
}

} // namespace arcstream::engine
