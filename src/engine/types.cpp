#include "engine/types.hpp"

#include <algorithm>

namespace arcstream::engine {

const char* toString(MemberStatus status) noexcept
{
    switch (status) {
    case MemberStatus::Extracted:
        return "extracted";
    case MemberStatus::Excluded:
        return "excluded";
    case MemberStatus::Rejected:
        return "rejected";
    case MemberStatus::Failed:
        return "failed";
    case MemberStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

const char* toString(IntegrityStatus status) noexcept
{
    switch (status) {
    case IntegrityStatus::NotChecked:
        return "not checked";
    case IntegrityStatus::Verified:
        return "verified";
    case IntegrityStatus::Mismatch:
        return "mismatch";
    case IntegrityStatus::Unavailable:
        return "unavailable";
    }
    return "unknown";
}

double CompressionResult::compressionRatio() const noexcept
{
    if (compressedSize == 0U) {
        return 0.0;
    }
    return static_cast<double>(originalSize) / static_cast<double>(compressedSize);
}

double CompressionResult::throughputMiBps() const noexcept
{
    const auto seconds = elapsed.count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(originalSize) / seconds / (1024.0 * 1024.0);
}

bool ZipExtractionResult::succeeded() const noexcept
{
    return failures.empty();
}

std::size_t countStatus(const std::vector<MemberOutcome>& outcomes, MemberStatus status)
{
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [status](const MemberOutcome& outcome) {
        return outcome.status == status;
    }));
}

std::vector<std::string> summarizeFailures(const std::vector<MemberFailure>& failures, std::size_t limit)
{
    std::vector<std::string> lines;
    const auto shown = std::min(limit, failures.size());
    lines.reserve(shown + 1);

    for (std::size_t index = 0; index < shown; ++index) {
        lines.push_back("  - " + failures[index].member + ": " + failures[index].error);
    }
    if (failures.size() > shown) {
        lines.push_back("  ... and " + std::to_string(failures.size() - shown) + " more errors");
    }
    return lines;
}

} // namespace arcstream::engine
