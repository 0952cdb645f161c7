#include "archive/zip_extractor.hpp"

#include "security/path_guard.hpp"
#include "utils/errors.hpp"
#include "utils/file_io.hpp"

#include <minizip-ng/mz.h>
#include <minizip-ng/mz_zip.h>
#include <minizip-ng/mz_zip_rw.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace arcstream::archive {

namespace {

std::string describeError(int32_t code)
{
    switch (code) {
    case MZ_CRC_ERROR:
        return "CRC mismatch";
    case MZ_PASSWORD_ERROR:
        return "wrong password";
    case MZ_DATA_ERROR:
        return "corrupt compressed data";
    case MZ_SUPPORT_ERROR:
        return "unsupported compression or encryption method";
    case MZ_FORMAT_ERROR:
        return "invalid zip structure";
    case MZ_STREAM_ERROR:
    case MZ_READ_ERROR:
        return "read error";
    default:
        return "zip error " + std::to_string(code);
    }
}

bool isEncrypted(const mz_zip_file* info)
{
    return (info->flag & MZ_ZIP_FLAG_ENCRYPTED) != 0;
}

} // namespace

ZipExtractor::ZipExtractor(std::filesystem::path archive)
    : archive_(std::move(archive))
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(archive_, ec)) {
        throw ExtractionError("The file " + archive_.string() + " does not exist.");
    }

    reader_ = mz_zip_reader_create();
    if (reader_ == nullptr) {
        throw ExtractionError("Failed to create zip reader");
    }

    const auto err = mz_zip_reader_open_file(reader_, archive_.string().c_str());
    if (err != MZ_OK) {
        mz_zip_reader_delete(&reader_);
        throw ExtractionError(archive_.string() + " is not a valid zip file (" + describeError(err) + ")");
    }
}

ZipExtractor::~ZipExtractor()
{
    if (reader_ != nullptr) {
        mz_zip_reader_close(reader_);
        mz_zip_reader_delete(&reader_);
    }
}

const std::filesystem::path& ZipExtractor::archive() const noexcept
{
    return archive_;
}

std::vector<std::string> ZipExtractor::memberNames()
{
    std::vector<std::string> names;

    auto err = mz_zip_reader_goto_first_entry(reader_);
    while (err == MZ_OK) {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(reader_, &info) == MZ_OK && info != nullptr && info->filename != nullptr) {
            names.emplace_back(info->filename);
        }
        err = mz_zip_reader_goto_next_entry(reader_);
    }
    if (err != MZ_END_OF_LIST) {
        throw ExtractionError("Failed to list members of " + archive_.string() + ": " + describeError(err));
    }
    return names;
}

std::optional<std::string> ZipExtractor::testArchive(const std::optional<std::string>& password)
{
    applyPassword(password);

    auto err = mz_zip_reader_goto_first_entry(reader_);
    while (err == MZ_OK) {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(reader_, &info) != MZ_OK || info == nullptr) {
            return std::string("<unreadable entry>");
        }

        const std::string name = info->filename != nullptr ? info->filename : "";
        if (mz_zip_reader_entry_is_dir(reader_) != MZ_OK) {
            const auto problem = drainCurrentEntry(kZipReadChunk);
            if (!problem.empty()) {
                spdlog::debug("Integrity check failed for {}: {}", name, problem);
                return name;
            }
        }
        err = mz_zip_reader_goto_next_entry(reader_);
    }

    if (err != MZ_END_OF_LIST) {
        return std::string("<central directory>");
    }
    return std::nullopt;
}

engine::ZipExtractionResult ZipExtractor::extractAll(const std::filesystem::path& outputRoot,
                                                     const engine::ZipOptions& options,
                                                     const engine::ProgressReporter& reporter,
                                                     std::size_t chunkSize)
{
    static const std::string kOperation = "extract";

    if (chunkSize == 0 || chunkSize > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::invalid_argument("ZIP read chunk size out of range: " + std::to_string(chunkSize));
    }

    std::error_code ec;
    std::filesystem::create_directories(outputRoot, ec);
    if (ec) {
        throw ExtractionError("Failed to create output directory " + outputRoot.string() + ": " + ec.message());
    }

    engine::ZipExtractionResult result;
    const auto members = memberNames();
    result.totalMembers = members.size();
    reporter.started(kOperation, "Extracting " + std::to_string(members.size()) + " files...", members.size());

    if (options.verifyIntegrity) {
        result.corruptedMember = testArchive(options.password);
        if (result.corruptedMember) {
            spdlog::warn("Corrupted file detected: {}", *result.corruptedMember);
            reporter.warning(kOperation, "Corrupted file detected: " + *result.corruptedMember);
        }
    }

    security::PathGuard guard(outputRoot);
    applyPassword(options.password);

    std::uint64_t processed = 0;
    auto err = mz_zip_reader_goto_first_entry(reader_);
    while (err == MZ_OK) {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(reader_, &info) != MZ_OK || info == nullptr) {
            throw ExtractionError("Failed to read entry metadata in " + archive_.string());
        }
        const std::string name = info->filename != nullptr ? info->filename : "";
        ++processed;

        if (engine::matchesAny(name, options.excludePatterns)) {
            result.outcomes.push_back({name, engine::MemberStatus::Excluded, {}});
        } else if (const auto target = guard.resolve(name); !target) {
            result.outcomes.push_back({name, engine::MemberStatus::Rejected, "path escapes the output directory"});
        } else if (mz_zip_reader_entry_is_dir(reader_) == MZ_OK) {
            std::filesystem::create_directories(*target, ec);
            if (ec) {
                result.failures.push_back({name, ec.message()});
                result.outcomes.push_back({name, engine::MemberStatus::Failed, ec.message()});
            } else {
                ++result.extractedCount;
                result.outcomes.push_back({name, engine::MemberStatus::Extracted, {}});
            }
        } else if (isEncrypted(info) && !options.password) {
            const std::string reason = "member is encrypted and no password was supplied";
            spdlog::warn("Failed to extract {}: {}", name, reason);
            result.failures.push_back({name, reason});
            result.outcomes.push_back({name, engine::MemberStatus::Failed, reason});
        } else {
            const auto problem = extractCurrentEntry(*target, chunkSize);
            if (problem.empty()) {
                ++result.extractedCount;
                result.outcomes.push_back({name, engine::MemberStatus::Extracted, {}});
            } else {
                spdlog::warn("Failed to extract {}: {}", name, problem);
                result.failures.push_back({name, problem});
                result.outcomes.push_back({name, engine::MemberStatus::Failed, problem});
            }
        }

        reporter.chunk(kOperation, processed, result.totalMembers);
        err = mz_zip_reader_goto_next_entry(reader_);
    }

    if (err != MZ_END_OF_LIST) {
        throw ExtractionError("Failed to iterate " + archive_.string() + ": " + describeError(err));
    }

    reporter.completed(kOperation, "Extracted " + std::to_string(result.extractedCount) + " of "
                                       + std::to_string(result.totalMembers) + " files");
    return result;
}

void ZipExtractor::applyPassword(const std::optional<std::string>& password)
{
    // The reader keeps the raw pointer, so it must point at storage we own.
    password_ = password;
    mz_zip_reader_set_password(reader_, password_ ? password_->c_str() : nullptr);
}

std::string ZipExtractor::extractCurrentEntry(const std::filesystem::path& target, std::size_t chunkSize)
{
    auto err = mz_zip_reader_entry_open(reader_);
    if (err != MZ_OK) {
        return describeError(err);
    }

    std::string problem;
    {
        std::ofstream output;
        try {
            output = utils::openOutputFile(target);
        } catch (const std::exception& ex) {
            mz_zip_reader_entry_close(reader_);
            return ex.what();
        }

        std::vector<char> buffer(chunkSize);
        while (true) {
            const auto count = mz_zip_reader_entry_read(reader_, buffer.data(), static_cast<int32_t>(buffer.size()));
            if (count < 0) {
                problem = describeError(count);
                break;
            }
            if (count == 0) {
                break;
            }
            output.write(buffer.data(), count);
            if (!output) {
                problem = "Failed to write " + target.string();
                break;
            }
        }
    }

    err = mz_zip_reader_entry_close(reader_);
    if (problem.empty() && err != MZ_OK) {
        problem = describeError(err);
    }

    if (!problem.empty()) {
        std::error_code ec;
        std::filesystem::remove(target, ec);
    }
    return problem;
}

std::string ZipExtractor::drainCurrentEntry(std::size_t chunkSize)
{
    auto err = mz_zip_reader_entry_open(reader_);
    if (err != MZ_OK) {
        return describeError(err);
    }

    std::string problem;
    std::vector<char> buffer(chunkSize);
    while (true) {
        const auto count = mz_zip_reader_entry_read(reader_, buffer.data(), static_cast<int32_t>(buffer.size()));
        if (count < 0) {
            problem = describeError(count);
            break;
        }
        if (count == 0) {
            break;
        }
    }

    err = mz_zip_reader_entry_close(reader_);
    if (problem.empty() && err != MZ_OK) {
        problem = describeError(err);
    }
    return problem;
}

} // namespace arcstream::archive
