#include "security/path_guard.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace arcstream::security {
namespace {

std::filesystem::path canonicalOrNormal(const std::filesystem::path& path)
{
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return canonical;
    }
    return std::filesystem::absolute(path).lexically_normal();
}

bool looksAbsolute(const std::string& name)
{
    if (name.empty()) {
        return false;
    }
    if (name.front() == '/') {
        return true;
    }
    // Drive-qualified names such as "C:" or "C:/" from archives made on Windows.
    return name.size() >= 2 && name[1] == ':' && std::isalpha(static_cast<unsigned char>(name[0])) != 0;
}

std::optional<std::string> rejectReason(const std::string& name)
{
    if (name.empty()) {
        return "empty member name";
    }
    if (name.find('\0') != std::string::npos) {
        return "member name contains NUL";
    }
    if (looksAbsolute(name)) {
        return "absolute member path";
    }
    return std::nullopt;
}

} // namespace

PathGuard::PathGuard(const std::filesystem::path& root)
{
    if (root.empty()) {
        throw std::invalid_argument("PathGuard requires a non-empty root");
    }
    root_ = canonicalOrNormal(root);
}

const std::filesystem::path& PathGuard::root() const noexcept
{
    return root_;
}

std::optional<std::filesystem::path> PathGuard::resolve(std::string_view memberName)
{
    std::string name(memberName);
    std::replace(name.begin(), name.end(), '\\', '/');

    auto reason = rejectReason(name);
    std::filesystem::path target;
    if (!reason) {
        target = canonicalOrNormal(root_ / std::filesystem::path(name));
        if (!isWithin(root_, target)) {
            reason = "resolves outside " + root_.string();
        }
    }

    if (reason) {
        ++rejected_;
        spdlog::warn("Skipping potentially unsafe path {}: {}", std::string(memberName), *reason);
        return std::nullopt;
    }

    return target;
}

std::size_t PathGuard::rejectedCount() const noexcept
{
    return rejected_;
}

bool isWithin(const std::filesystem::path& root, const std::filesystem::path& candidate)
{
    auto rootIt = root.begin();
    auto candidateIt = candidate.begin();
    for (; rootIt != root.end(); ++rootIt, ++candidateIt) {
        // A trailing separator shows up as an empty final element.
        if (rootIt->empty() && std::next(rootIt) == root.end()) {
            break;
        }
        if (candidateIt == candidate.end() || *rootIt != *candidateIt) {
            return false;
        }
    }
    return true;
}

} // namespace arcstream::security
