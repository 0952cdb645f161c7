#include "container/unpacker.hpp"

#include "utils/errors.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arcstream::container {
namespace {

constexpr std::uint64_t kMaxMetadataPayload = 1024 * 1024;

using Block = std::array<char, kBlockSize>;

std::string fieldString(const char* field, std::size_t width)
{
    const auto* end = static_cast<const char*>(std::memchr(field, '\0', width));
    return std::string(field, end == nullptr ? width : static_cast<std::size_t>(end - field));
}

std::uint64_t parseNumber(const char* field, std::size_t width)
{
    const auto lead = static_cast<unsigned char>(field[0]);
    if ((lead & 0x80U) != 0U) {
        std::uint64_t value = lead & 0x7FU;
        for (std::size_t index = 1; index < width; ++index) {
            value = (value << 8U) | static_cast<unsigned char>(field[index]);
        }
        return value;
    }

    std::uint64_t value = 0;
    std::size_t index = 0;
    while (index < width && (field[index] == ' ' || field[index] == '\0')) {
        ++index;
    }
    for (; index < width; ++index) {
        const char digit = field[index];
        if (digit == '\0' || digit == ' ') {
            break;
        }
        if (digit < '0' || digit > '7') {
            throw ContainerFormatError("Invalid octal field in container header");
        }
        value = (value << 3U) | static_cast<std::uint64_t>(digit - '0');
    }
    return value;
}

bool isZeroBlock(const Block& block)
{
    return std::all_of(block.begin(), block.end(), [](char byte) { return byte == '\0'; });
}

bool checksumMatches(const Block& block)
{
    const auto stored = parseNumber(block.data() + 148, 8);

    std::uint64_t unsignedSum = 0;
    std::int64_t signedSum = 0;
    for (std::size_t index = 0; index < block.size(); ++index) {
        const bool inChecksum = index >= 148 && index < 156;
        const char byte = inChecksum ? ' ' : block[index];
        unsignedSum += static_cast<unsigned char>(byte);
        signedSum += static_cast<signed char>(byte);
    }

    return stored == unsignedSum || static_cast<std::int64_t>(stored) == signedSum;
}

struct PaxOverrides {
    std::optional<std::string> path;
    std::optional<std::uint64_t> size;
    std::optional<std::string> incomplete;
};

void parsePaxRecords(const std::string& payload, PaxOverrides& overrides)
{
    std::size_t position = 0;
    while (position < payload.size()) {
        const auto space = payload.find(' ', position);
        if (space == std::string::npos) {
            throw ContainerFormatError("Malformed PAX extended header");
        }

        std::size_t length = 0;
        try {
            length = static_cast<std::size_t>(std::stoull(payload.substr(position, space - position)));
        } catch (const std::exception&) {
            throw ContainerFormatError("Malformed PAX record length");
        }
        if (length == 0 || position + length > payload.size() || space >= position + length) {
            throw ContainerFormatError("PAX record length out of range");
        }

        auto record = payload.substr(space + 1, position + length - space - 1);
        if (!record.empty() && record.back() == '\n') {
            record.pop_back();
        }

        const auto equals = record.find('=');
        if (equals != std::string::npos) {
            const auto key = record.substr(0, equals);
            const auto value = record.substr(equals + 1);
            if (key == "path") {
                overrides.path = value;
            } else if (key == kIncompleteKey) {
                overrides.incomplete = value;
            } else if (key == "size") {
                try {
                    overrides.size = std::stoull(value);
                } catch (const std::exception&) {
                    throw ContainerFormatError("Malformed PAX size record");
                }
            }
        }

        position += length;
    }
}

EntryType typeFromFlag(char flag, const std::string& path)
{
    switch (flag) {
    case '0':
    case '\0':
    case '7':
        return !path.empty() && path.back() == '/' ? EntryType::Directory : EntryType::File;
    case '5':
        return EntryType::Directory;
    case '1':
    case '2':
        return EntryType::Symlink;
    default:
        return EntryType::Other;
    }
}

std::uint64_t paddingFor(std::uint64_t size)
{
    const auto rest = size % kBlockSize;
    return rest == 0U ? 0U : kBlockSize - rest;
}

} // namespace

ContainerUnpacker::ContainerUnpacker(std::istream& source)
    : source_(source)
{
}

bool ContainerUnpacker::next(ContainerEntry& entry)
{
    finishRecord();
    if (ended_) {
        return false;
    }

    PaxOverrides overrides;
    std::optional<std::string> longName;
    Block block {};

    while (true) {
        if (!readBlock(block.data())) {
            throw ContainerFormatError("Container stream ended before the end-of-archive marker");
        }
        if (isZeroBlock(block)) {
            ended_ = true;
            return false;
        }

        if (!checksumMatches(block)) {
            throw ContainerFormatError("Container header checksum mismatch");
        }

        const char flag = block[156];
        const auto size = parseNumber(block.data() + 124, 12);

        if (flag == 'x') {
            parsePaxRecords(readPayload(size), overrides);
            if (overrides.incomplete) {
                incomplete_ = std::move(overrides.incomplete);
                overrides.incomplete.reset();
            }
            continue;
        }
        if (flag == 'g') {
            readPayload(size);
            continue;
        }
        if (flag == 'L') {
            const auto payload = readPayload(size);
            longName = payload.substr(0, payload.find('\0'));
            continue;
        }

        std::string path = fieldString(block.data(), kNameFieldSize);
        if (std::memcmp(block.data() + 257, kUstarMagic, 5) == 0) {
            const auto prefix = fieldString(block.data() + 345, kPrefixFieldSize);
            if (!prefix.empty()) {
                path = prefix + "/" + path;
            }
        }
        if (longName) {
            path = *longName;
        }
        if (overrides.path) {
            path = *overrides.path;
        }

        entry = ContainerEntry {};
        entry.path = std::move(path);
        entry.size = overrides.size.value_or(size);
        entry.type = typeFromFlag(flag, entry.path);
        entry.mode = static_cast<std::uint32_t>(parseNumber(block.data() + 100, 8));
        entry.modifiedTime = static_cast<std::int64_t>(parseNumber(block.data() + 136, 12));
        entry.linkTarget = fieldString(block.data() + 157, kNameFieldSize);

        const auto payloadSize = entry.type == EntryType::Symlink ? 0U : entry.size;
        remaining_ = payloadSize;
        padding_ = paddingFor(payloadSize);
        return true;
    }
}

std::size_t ContainerUnpacker::read(char* buffer, std::size_t size)
{
    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, size));
    if (wanted == 0U) {
        return 0;
    }

    source_.read(buffer, static_cast<std::streamsize>(wanted));
    const auto got = static_cast<std::size_t>(source_.gcount());
    if (got != wanted) {
        throw ContainerFormatError("Container stream ended inside an entry");
    }

    remaining_ -= got;
    return got;
}

std::optional<std::string> ContainerUnpacker::takeIncomplete()
{
    auto incomplete = std::move(incomplete_);
    incomplete_.reset();
    return incomplete;
}

std::uint64_t ContainerUnpacker::remaining() const noexcept
{
    return remaining_;
}

bool ContainerUnpacker::readBlock(char* block)
{
    source_.read(block, static_cast<std::streamsize>(kBlockSize));
    const auto got = static_cast<std::size_t>(source_.gcount());
    if (source_.bad()) {
        throw ContainerFormatError("Failed to read container stream");
    }
    if (got == 0U) {
        return false;
    }
    if (got != kBlockSize) {
        throw ContainerFormatError("Truncated container header");
    }
    return true;
}

void ContainerUnpacker::skip(std::uint64_t count)
{
    std::array<char, 16 * 1024> scratch {};
    while (count > 0U) {
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(count, scratch.size()));
        source_.read(scratch.data(), static_cast<std::streamsize>(wanted));
        const auto got = static_cast<std::size_t>(source_.gcount());
        if (got != wanted) {
            throw ContainerFormatError("Container stream ended inside an entry");
        }
        count -= got;
    }
}

void ContainerUnpacker::finishRecord()
{
    skip(remaining_ + padding_);
    remaining_ = 0;
    padding_ = 0;
}

std::string ContainerUnpacker::readPayload(std::uint64_t size)
{
    if (size > kMaxMetadataPayload) {
        throw ContainerFormatError("Container metadata record is too large");
    }

    std::string payload(static_cast<std::size_t>(size), '\0');
    if (size > 0U) {
        source_.read(payload.data(), static_cast<std::streamsize>(size));
        if (source_.gcount() != static_cast<std::streamsize>(size)) {
            throw ContainerFormatError("Container stream ended inside a metadata record");
        }
    }
    skip(paddingFor(size));
    return payload;
}

} // namespace arcstream::container
