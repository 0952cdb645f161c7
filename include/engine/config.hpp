#pragma once

#include "compression/zstd/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace arcstream::engine {

// Chunks are handed to the ZIP reader as a 32-bit length.
inline constexpr std::size_t kMaxChunkSize = 256 * 1024 * 1024;

std::size_t defaultParallelThreads() noexcept;

struct EngineConfig {
    std::size_t chunkSize {compression::zstd::kDefaultChunkSize};
    int compressionLevel {compression::zstd::kDefaultLevel};
    bool verifyIntegrity {true};
    std::size_t parallelThreads {defaultParallelThreads()};

    void validate() const;
};

struct CompressOptions {
    std::optional<int> level;
    bool computeHash {true};
    std::vector<std::string> excludePatterns;
    bool parallel {true};
};

struct DecompressOptions {
    bool verifyHash {true};
};

struct ZipOptions {
    std::vector<std::string> excludePatterns;
    std::optional<std::string> password;
    bool verifyIntegrity {true};
};

bool matchesAny(const std::string& path, const std::vector<std::string>& patterns);

} // namespace arcstream::engine
