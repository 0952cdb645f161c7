#pragma once

#include "container/types.hpp"

#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace arcstream::container {

// Content ended before the declared size. The record was zero-padded so the
// container stays well formed, and is followed by a kIncompleteKey marker.
class ShortEntryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ContainerPacker {
public:
    explicit ContainerPacker(std::ostream& sink, std::size_t chunkSize = 64 * 1024);

    void addFile(const ContainerEntry& entry, std::istream& content);
    void addDirectory(const ContainerEntry& entry);
    void finish();

    std::size_t entryCount() const noexcept;
    std::uint64_t bytesWritten() const noexcept;

private:
    void writeHeader(const ContainerEntry& entry, char typeFlag);
    void writePaxHeader(const std::string& path, const std::string& payload, std::int64_t modifiedTime);
    void writeBlock(const char* block);
    void writeRaw(const char* data, std::size_t size);
    void writePadding(std::uint64_t contentSize);

    std::ostream& sink_;
    std::size_t chunkSize_;
    std::size_t entryCount_ {0};
    std::uint64_t bytesWritten_ {0};
    bool finished_ {false};
};

} // namespace arcstream::container
