#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace arcstream::container {

inline constexpr std::size_t kBlockSize = 512;
inline constexpr std::size_t kNameFieldSize = 100;
inline constexpr std::size_t kPrefixFieldSize = 155;
inline constexpr char kUstarMagic[6] = {'u', 's', 't', 'a', 'r', '\0'};
inline constexpr char kUstarVersion[2] = {'0', '0'};
// Largest size representable in the 11-digit octal size field.
inline constexpr std::uint64_t kMaxOctalSize = 077777777777ULL;

// PAX key written after a file record whose content ended early. The value
// is the path of that record.
inline constexpr char kIncompleteKey[] = "ARCS.incomplete";

enum class EntryType {
    File,
    Directory,
    Symlink,
    Other
};

// Metadata for one record; content is supplied separately as a stream.
struct ContainerEntry {
    std::string path;
    std::uint64_t size {0};
    EntryType type {EntryType::File};
    std::uint32_t mode {0644};
    std::int64_t modifiedTime {0};
    std::string linkTarget;
};

} // namespace arcstream::container
