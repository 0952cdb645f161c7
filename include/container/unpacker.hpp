#pragma once

#include "container/types.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace arcstream::container {

class ContainerUnpacker {
public:
    explicit ContainerUnpacker(std::istream& source);

    // Advances to the next record, skipping any unread content of the
    // current one. Returns false at the end of the container.
    bool next(ContainerEntry& entry);

    // Reads content of the current record; returns 0 once it is exhausted.
    std::size_t read(char* buffer, std::size_t size);

    std::uint64_t remaining() const noexcept;

    // Path of the record before the last next() call when the writer
    // flagged its content as ending early. Cleared once taken.
    std::optional<std::string> takeIncomplete();

private:
    bool readBlock(char* block);
    void skip(std::uint64_t count);
    void finishRecord();
    std::string readPayload(std::uint64_t size);

    std::istream& source_;
    std::uint64_t remaining_ {0};
    std::uint64_t padding_ {0};
    std::optional<std::string> incomplete_;
    bool ended_ {false};
};

} // namespace arcstream::container
