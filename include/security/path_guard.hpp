#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace arcstream::security {

// Resolves archive member names under an output root and refuses any name
// that would land outside of it.
class PathGuard {
public:
    explicit PathGuard(const std::filesystem::path& root);

    const std::filesystem::path& root() const noexcept;

    std::optional<std::filesystem::path> resolve(std::string_view memberName);

    std::size_t rejectedCount() const noexcept;

private:
    std::filesystem::path root_;
    std::size_t rejected_ {0};
};

bool isWithin(const std::filesystem::path& root, const std::filesystem::path& candidate);

} // namespace arcstream::security
