#include "utils/file_io.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <system_error>

namespace arcstream::utils {

void ensureParentDirectory(const std::filesystem::path& path)
{
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("create_directories", parent, ec);
    }
}

std::ifstream openInputFile(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    return input;
}

std::ofstream openOutputFile(const std::filesystem::path& path)
{
    ensureParentDirectory(path);

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    return output;
}

PartialOutputGuard::~PartialOutputGuard()
{
    if (!committed_) {
        cleanup();
    }
}

void PartialOutputGuard::track(const std::filesystem::path& path)
{
    paths_.push_back(path);
}

void PartialOutputGuard::commit() noexcept
{
    committed_ = true;
}

void PartialOutputGuard::cleanup() noexcept
{
    for (auto it = paths_.rbegin(); it != paths_.rend(); ++it) {
        std::error_code ec;
        std::filesystem::remove_all(*it, ec);
        if (ec) {
            spdlog::debug("Could not remove partial output {}: {}", it->string(), ec.message());
        }
    }
    paths_.clear();
}

} // namespace arcstream::utils
