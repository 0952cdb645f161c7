#pragma once

#include <stdexcept>
#include <string>

namespace arcstream {

class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Source missing, codec failure or I/O failure while producing an archive.
class CompressionError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

// Archive missing or unreadable while extracting.
class ExtractionError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

class DecompressionError : public ExtractionError {
public:
    using ExtractionError::ExtractionError;
};

class ContainerFormatError : public ExtractionError {
public:
    using ExtractionError::ExtractionError;
};

} // namespace arcstream
