#include "engine/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <utility>

namespace arcstream::engine {

double ProgressEvent::fraction() const noexcept
{
    if (total == 0U) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(processed) / static_cast<double>(total));
}

ProgressReporter::ProgressReporter(ProgressCallback callback)
    : callback_(std::move(callback))
{
}

void ProgressReporter::started(const std::string& operation, const std::string& message, std::uint64_t total) const
{
    notify(ProgressEvent {ProgressStage::Started, operation, message, 0, total});
}

void ProgressReporter::chunk(const std::string& operation, std::uint64_t processed, std::uint64_t total) const
{
    notify(ProgressEvent {ProgressStage::Chunk, operation, {}, processed, total});
}

void ProgressReporter::completed(const std::string& operation, const std::string& message) const
{
    notify(ProgressEvent {ProgressStage::Completed, operation, message, 0, 0});
}

void ProgressReporter::warning(const std::string& operation, const std::string& message) const
{
    notify(ProgressEvent {ProgressStage::Warning, operation, message, 0, 0});
}

void ProgressReporter::notify(const ProgressEvent& event) const
{
    if (!callback_) {
        return;
    }

    try {
        callback_(event);
    } catch (const std::exception& ex) {
        spdlog::debug("Progress consumer failed for {}: {}", event.operation, ex.what());
    } catch (...) {
        spdlog::debug("Progress consumer failed for {} with a non-standard exception", event.operation);
    }
}

std::string formatProgress(const ProgressEvent& event)
{
    switch (event.stage) {
    case ProgressStage::Started:
    case ProgressStage::Completed:
        return event.message;
    case ProgressStage::Warning:
        return "WARNING: " + event.message;
    case ProgressStage::Chunk:
        break;
    }

    char line[96];
    if (event.total > 0U) {
        std::snprintf(line, sizeof(line), "%s: %llu/%llu (%.1f%%)", event.operation.c_str(),
                      static_cast<unsigned long long>(event.processed),
                      static_cast<unsigned long long>(event.total), event.fraction() * 100.0);
    } else {
        std::snprintf(line, sizeof(line), "%s: %llu", event.operation.c_str(),
                      static_cast<unsigned long long>(event.processed));
    }
    return line;
}

} // namespace arcstream::engine
