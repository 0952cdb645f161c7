#include "filesystem/resource_context.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <system_error>

namespace arcstream::filesystem {

namespace {

std::filesystem::path makeAbsolute(const std::filesystem::path& path)
{
    std::error_code ec;
    auto absolute = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return absolute;
    }

    absolute = std::filesystem::absolute(path, ec);
    if (!ec) {
        return absolute;
    }

    return path;
}

EntryType resolveType(const std::filesystem::file_status& status)
{
    switch (status.type()) {
    case std::filesystem::file_type::regular:
        return EntryType::File;
    case std::filesystem::file_type::directory:
        return EntryType::Directory;
    case std::filesystem::file_type::symlink:
        return EntryType::Symlink;
    default:
        return EntryType::Other;
    }
}

std::filesystem::file_time_type safeLastWriteTime(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::filesystem::file_time_type {};
    }
    return time;
}

std::uintmax_t safeFileSize(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return 0;
    }
    return size;
}

std::vector<std::filesystem::directory_entry> readChildren(const std::filesystem::path& directory,
                                                          std::error_code& ec)
{
    std::vector<std::filesystem::directory_entry> children;
    std::filesystem::directory_iterator iterator(directory, ec);
    const std::filesystem::directory_iterator end;
    while (!ec && iterator != end) {
        children.push_back(*iterator);
        iterator.increment(ec);
    }
    if (ec) {
        return {};
    }

    std::sort(children.begin(), children.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.path().filename().string() < rhs.path().filename().string();
    });
    return children;
}

bool isExcluded(const std::string& relative, const std::vector<std::string>& patterns)
{
    return std::any_of(patterns.begin(), patterns.end(), [&relative](const std::string& pattern) {
        return !pattern.empty() && relative.find(pattern) != std::string::npos;
    });
}

} // namespace

FileDescriptor describePath(const std::filesystem::path& path)
{
    if (path.empty()) {
        throw std::invalid_argument("Provided path is empty");
    }

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw std::filesystem::filesystem_error("symlink_status", path,
                                                ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
    }

    const auto absolute = makeAbsolute(path);

    FileDescriptor descriptor {};
    descriptor.absolutePath = absolute;
    descriptor.relativePath = absolute.filename();
    descriptor.type = resolveType(status);
    descriptor.permissions = status.permissions();
    descriptor.lastWriteTime = safeLastWriteTime(path);
    if (descriptor.type == EntryType::File) {
        descriptor.size = safeFileSize(path);
    }

    return descriptor;
}

std::int64_t toUnixTime(std::filesystem::file_time_type time)
{
    if (time == std::filesystem::file_time_type {}) {
        return 0;
    }

    const auto system = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(system.time_since_epoch()).count();
    return std::max<std::int64_t>(0, static_cast<std::int64_t>(seconds));
}

FileContext::FileContext(std::filesystem::path sourcePath)
    : descriptor_(describePath(sourcePath))
{
    if (descriptor_.type != EntryType::File) {
        throw std::invalid_argument("FileContext requires a regular file: " + sourcePath.string());
    }
}

const FileDescriptor& FileContext::descriptor() const noexcept
{
    return descriptor_;
}

std::ifstream FileContext::open() const
{
    std::ifstream input(descriptor_.absolutePath, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + descriptor_.absolutePath.string());
    }
    return input;
}

DirectoryContext::DirectoryContext(std::filesystem::path rootPath)
    : rootPath_(makeAbsolute(rootPath))
{
    std::error_code ec;
    if (!std::filesystem::exists(rootPath_, ec) || !std::filesystem::is_directory(rootPath_, ec)) {
        throw std::invalid_argument("DirectoryContext requires an existing directory: " + rootPath.string());
    }
}

const std::filesystem::path& DirectoryContext::root() const noexcept
{
    return rootPath_;
}

std::vector<FileDescriptor> DirectoryContext::listEntries(const std::vector<std::string>& excludePatterns,
                                                          bool includeDirectories) const
{
    std::error_code ec;
    const auto children = readChildren(rootPath_, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("directory_iterator", rootPath_, ec);
    }

    std::vector<FileDescriptor> entries;
    walk(children, excludePatterns, includeDirectories, entries);
    return entries;
}

void DirectoryContext::walk(const std::vector<std::filesystem::directory_entry>& children,
                            const std::vector<std::string>& excludePatterns,
                            bool includeDirectories,
                            std::vector<FileDescriptor>& entries) const
{
    for (const auto& child : children) {
        auto descriptor = buildDescriptor(child);
        if (isExcluded(descriptor.relativePath.generic_string(), excludePatterns)) {
            continue;
        }

        if (descriptor.type == EntryType::Directory) {
            std::error_code ec;
            const auto grandchildren = readChildren(child.path(), ec);
            if (ec) {
                descriptor.error = ec.message();
                entries.push_back(std::move(descriptor));
                continue;
            }
            if (includeDirectories) {
                entries.push_back(descriptor);
            }
            walk(grandchildren, excludePatterns, includeDirectories, entries);
            continue;
        }

        entries.push_back(std::move(descriptor));
    }
}

FileDescriptor DirectoryContext::buildDescriptor(const std::filesystem::directory_entry& entry) const
{
    std::error_code ec;
    const auto status = entry.symlink_status(ec);

    FileDescriptor descriptor {};
    descriptor.absolutePath = entry.path();
    descriptor.relativePath = entry.path().lexically_relative(rootPath_);
    if (descriptor.relativePath.empty()) {
        descriptor.relativePath = entry.path().filename();
    }
    descriptor.type = ec ? EntryType::Other : resolveType(status);
    descriptor.permissions = ec ? std::filesystem::perms::unknown : status.permissions();
    descriptor.lastWriteTime = safeLastWriteTime(entry.path());
    if (descriptor.type == EntryType::File) {
        descriptor.size = safeFileSize(entry.path());
    }

    return descriptor;
}

} // namespace arcstream::filesystem
