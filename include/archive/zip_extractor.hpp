#pragma once

#include "engine/config.hpp"
#include "engine/progress.hpp"
#include "engine/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace arcstream::archive {

inline constexpr std::size_t kZipReadChunk = 64 * 1024;

// Read-only view of one ZIP archive. Opening an unreadable archive throws
// ExtractionError; per-member problems during extractAll() are collected
// into the result instead.
class ZipExtractor {
public:
    explicit ZipExtractor(std::filesystem::path archive);
    ~ZipExtractor();

    ZipExtractor(const ZipExtractor&) = delete;
    ZipExtractor& operator=(const ZipExtractor&) = delete;

    const std::filesystem::path& archive() const noexcept;

    std::vector<std::string> memberNames();

    // Reads every member through the CRC check and returns the first one
    // that fails, if any.
    std::optional<std::string> testArchive(const std::optional<std::string>& password = std::nullopt);

    engine::ZipExtractionResult extractAll(const std::filesystem::path& outputRoot,
                                           const engine::ZipOptions& options,
                                           const engine::ProgressReporter& reporter = {},
                                           std::size_t chunkSize = kZipReadChunk);

private:
    void applyPassword(const std::optional<std::string>& password);

    // Returns an empty string on success, otherwise the failure reason.
    std::string extractCurrentEntry(const std::filesystem::path& target, std::size_t chunkSize);
    std::string drainCurrentEntry(std::size_t chunkSize);

    std::filesystem::path archive_;
    std::optional<std::string> password_;
    void* reader_ {nullptr};
};

} // namespace arcstream::archive
