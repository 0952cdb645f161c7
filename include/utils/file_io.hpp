#pragma once

#include <filesystem>
#include <fstream>
#include <vector>

namespace arcstream::utils {

void ensureParentDirectory(const std::filesystem::path& path);

std::ifstream openInputFile(const std::filesystem::path& path);
std::ofstream openOutputFile(const std::filesystem::path& path);

// Removes every tracked path on destruction unless commit() was called.
// Paths are removed in reverse order of tracking.
class PartialOutputGuard {
public:
    PartialOutputGuard() = default;
    ~PartialOutputGuard();

    PartialOutputGuard(const PartialOutputGuard&) = delete;
    PartialOutputGuard& operator=(const PartialOutputGuard&) = delete;

    void track(const std::filesystem::path& path);
    void commit() noexcept;
    void cleanup() noexcept;

private:
    std::vector<std::filesystem::path> paths_;
    bool committed_ {false};
};

} // namespace arcstream::utils
