#include "engine/config.hpp"

#include "compression/zstd/codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

namespace arcstream::engine {

std::size_t defaultParallelThreads() noexcept
{
    const auto hardware = std::thread::hardware_concurrency();
    return hardware == 0U ? 4U : static_cast<std::size_t>(hardware);
}

void EngineConfig::validate() const
{
    if (chunkSize == 0U) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }
    if (chunkSize > kMaxChunkSize) {
        throw std::invalid_argument("Chunk size must not exceed " + std::to_string(kMaxChunkSize) + " bytes");
    }
    compression::zstd::validateLevel(compressionLevel);
    if (parallelThreads == 0U) {
        throw std::invalid_argument("Parallel thread count must be at least 1");
    }
}

bool matchesAny(const std::string& path, const std::vector<std::string>& patterns)
{
    return std::any_of(patterns.begin(), patterns.end(), [&path](const std::string& pattern) {
        return !pattern.empty() && path.find(pattern) != std::string::npos;
    });
}

} // namespace arcstream::engine
