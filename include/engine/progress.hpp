#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace arcstream::engine {

enum class ProgressStage {
    Started,
    Chunk,
    Completed,
    Warning
};

struct ProgressEvent {
    ProgressStage stage {ProgressStage::Started};
    std::string operation;
    std::string message;
    std::uint64_t processed {0};
    std::uint64_t total {0};

    // 0..1 when the total is known, otherwise 0.
    double fraction() const noexcept;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// One-way notification channel. A consumer that throws is logged and
// ignored so it cannot stall or fail the I/O loop.
class ProgressReporter {
public:
    ProgressReporter() = default;
    explicit ProgressReporter(ProgressCallback callback);

    void started(const std::string& operation, const std::string& message, std::uint64_t total = 0) const;
    void chunk(const std::string& operation, std::uint64_t processed, std::uint64_t total) const;
    void completed(const std::string& operation, const std::string& message) const;
    void warning(const std::string& operation, const std::string& message) const;

    void notify(const ProgressEvent& event) const;

private:
    ProgressCallback callback_;
};

std::string formatProgress(const ProgressEvent& event);

} // namespace arcstream::engine
