#pragma once

#include "engine/config.hpp"
#include "engine/progress.hpp"
#include "engine/types.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace arcstream::engine {

// Entry point for every archive operation. Each call is independent and
// returns its own result; the engine keeps no state between calls, so one
// instance may serve concurrent callers.
class ArchiveEngine {
public:
    explicit ArchiveEngine(EngineConfig config = {});

    const EngineConfig& config() const noexcept;

    // Compresses one file into a tagged zstd stream and, when hashing is on,
    // writes "<destination>.sha256" next to it.
    CompressionResult compressFile(const std::filesystem::path& source,
                                   const std::filesystem::path& destination,
                                   const CompressOptions& options = {},
                                   const ProgressReporter& reporter = {}) const;

    // Packs a directory tree into a container and compresses it in one pass.
    // Entries are stored as "<folder name>/<relative path>".
    CompressionResult compressFolder(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     const CompressOptions& options = {},
                                     const ProgressReporter& reporter = {}) const;

    // Restores a file or a folder tree. For folder archives `destination` is
    // the directory that receives the original folder.
    DecompressionResult decompress(const std::filesystem::path& source,
                                   const std::filesystem::path& destination,
                                   const DecompressOptions& options = {},
                                   const ProgressReporter& reporter = {}) const;

    ZipExtractionResult extractZip(const std::filesystem::path& archive,
                                   const std::filesystem::path& outputRoot,
                                   const ZipOptions& options = {},
                                   const ProgressReporter& reporter = {}) const;

    // Runs independent single-file jobs on a worker pool. Results keep the
    // order of `jobs`; a failing job does not affect the others.
    std::vector<BatchOutcome> compressFiles(const std::vector<CompressionJob>& jobs,
                                            std::size_t threadCount = 0) const;

    ArchiveInfo inspect(const std::filesystem::path& archive) const;

private:
    CompressionResult runFileJob(const CompressionJob& job,
                                 std::size_t workerThreads,
                                 const ProgressReporter& reporter) const;

    compression::zstd::PayloadKind detectKind(const std::filesystem::path& source, bool& tagged) const;

    void decompressSingle(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          const DecompressOptions& options,
                          const ProgressReporter& reporter,
                          DecompressionResult& result) const;

    void decompressContainer(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             const ProgressReporter& reporter,
                             DecompressionResult& result) const;

    std::size_t codecThreads(bool parallel) const noexcept;

    EngineConfig config_;
};

} // namespace arcstream::engine
