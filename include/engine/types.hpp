#pragma once

#include "compression/zstd/types.hpp"
#include "integrity/hash_verifier.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace arcstream::engine {

enum class MemberStatus {
    Extracted,
    Excluded,
    Rejected,
    Failed,
    Skipped
};

const char* toString(MemberStatus status) noexcept;

struct MemberOutcome {
    std::string name;
    MemberStatus status {MemberStatus::Extracted};
    std::string message;
};

struct MemberFailure {
    std::string member;
    std::string error;
};

enum class IntegrityStatus {
    NotChecked,
    Verified,
    Mismatch,
    Unavailable
};

const char* toString(IntegrityStatus status) noexcept;

struct CompressionJob {
    std::filesystem::path source;
    std::filesystem::path destination;
    int level {compression::zstd::kDefaultLevel};
    std::size_t chunkSize {compression::zstd::kDefaultChunkSize};
    bool computeHash {true};
};

struct CompressionResult {
    std::uint64_t originalSize {0};
    std::uint64_t compressedSize {0};
    std::chrono::duration<double> elapsed {};
    std::size_t filesProcessed {0};
    std::optional<std::string> digest;
    std::vector<MemberOutcome> outcomes;

    double compressionRatio() const noexcept;
    double throughputMiBps() const noexcept;
};

struct DecompressionResult {
    bool success {false};
    std::size_t extractedCount {0};
    compression::zstd::PayloadKind kind {compression::zstd::PayloadKind::SingleFile};
    bool tagged {false};
    IntegrityStatus integrity {IntegrityStatus::NotChecked};
    std::filesystem::path output;
    std::chrono::duration<double> elapsed {};
    std::vector<MemberOutcome> outcomes;
    std::vector<std::string> warnings;
};

struct ZipExtractionResult {
    std::size_t extractedCount {0};
    std::size_t totalMembers {0};
    std::vector<MemberFailure> failures;
    std::vector<MemberOutcome> outcomes;
    std::optional<std::string> corruptedMember;

    // Partial success is a non-empty failures list.
    bool succeeded() const noexcept;
};

struct BatchOutcome {
    CompressionJob job;
    std::optional<CompressionResult> result;
    std::string error;
};

struct ArchiveInfo {
    std::filesystem::path path;
    std::uint64_t compressedSize {0};
    std::optional<compression::zstd::PayloadKind> kind;
    bool tagged {false};
    std::optional<integrity::SidecarDigest> sidecar;
};

std::size_t countStatus(const std::vector<MemberOutcome>& outcomes, MemberStatus status);

// First `limit` failures plus a "... and N more errors" line.
std::vector<std::string> summarizeFailures(const std::vector<MemberFailure>& failures, std::size_t limit = 5);

} // namespace arcstream::engine
