#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace arcstream::filesystem {

enum class EntryType {
    File,
    Directory,
    Symlink,
    Other
};

struct FileDescriptor {
    std::filesystem::path absolutePath;
    std::filesystem::path relativePath;
    EntryType type {EntryType::File};
    std::uintmax_t size {0};
    std::filesystem::file_time_type lastWriteTime {};
    std::filesystem::perms permissions {std::filesystem::perms::unknown};
    // Set on a directory whose contents could not be listed.
    std::string error;
};

FileDescriptor describePath(const std::filesystem::path& path);

// Seconds since the Unix epoch, 0 when the time is unavailable.
std::int64_t toUnixTime(std::filesystem::file_time_type time);

class FileContext {
public:
    explicit FileContext(std::filesystem::path sourcePath);

    const FileDescriptor& descriptor() const noexcept;

    std::ifstream open() const;

private:
    FileDescriptor descriptor_;
};

// Depth-first walk, siblings sorted by name. Symlinks are reported
// but never followed. A subdirectory that cannot be listed is reported
// with its error set, even when directories are not requested, and the
// walk continues.
class DirectoryContext {
public:
    explicit DirectoryContext(std::filesystem::path rootPath);

    const std::filesystem::path& root() const noexcept;

    std::vector<FileDescriptor> listEntries(const std::vector<std::string>& excludePatterns = {},
                                            bool includeDirectories = false) const;

private:
    void walk(const std::vector<std::filesystem::directory_entry>& children,
              const std::vector<std::string>& excludePatterns,
              bool includeDirectories,
              std::vector<FileDescriptor>& entries) const;

    FileDescriptor buildDescriptor(const std::filesystem::directory_entry& entry) const;

    std::filesystem::path rootPath_;
};

} // namespace arcstream::filesystem
