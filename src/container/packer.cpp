#include "container/packer.hpp"

#include "utils/errors.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <optional>
#include <ostream>
#include <istream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace arcstream::container {
namespace {

using Block = std::array<char, kBlockSize>;

void writeOctal(char* field, std::size_t width, std::uint64_t value)
{
    // width - 1 zero-padded digits followed by NUL
    std::size_t index = width - 1;
    field[index] = '\0';
    while (index > 0) {
        --index;
        field[index] = static_cast<char>('0' + (value & 7U));
        value >>= 3U;
    }
    if (value != 0U) {
        throw std::overflow_error("Value does not fit octal header field");
    }
}

void writeBase256(char* field, std::size_t width, std::uint64_t value)
{
    std::memset(field, 0, width);
    for (std::size_t index = width; index > 1; --index) {
        field[index - 1] = static_cast<char>(value & 0xFFU);
        value >>= 8U;
    }
    field[0] = static_cast<char>(0x80);
}

void copyField(char* field, std::size_t width, const std::string& value)
{
    std::memcpy(field, value.data(), std::min(width, value.size()));
}

std::optional<std::pair<std::string, std::string>> splitUstarPath(const std::string& path)
{
    if (path.size() <= kNameFieldSize) {
        return std::make_pair(std::string {}, path);
    }

    // Moving the split point left only lengthens the name part.
    const auto slash = path.rfind('/', std::min(path.size() - 1, kPrefixFieldSize));
    if (slash == std::string::npos || slash == 0) {
        return std::nullopt;
    }

    const auto nameLength = path.size() - slash - 1;
    if (nameLength == 0 || nameLength > kNameFieldSize) {
        return std::nullopt;
    }
    return std::make_pair(path.substr(0, slash), path.substr(slash + 1));
}

std::string paxRecord(const std::string& key, const std::string& value)
{
    const auto body = " " + key + "=" + value + "\n";
    auto length = body.size() + 1;
    while (std::to_string(length).size() + body.size() != length) {
        length = std::to_string(length).size() + body.size();
    }
    return std::to_string(length) + body;
}

std::uint64_t paddingFor(std::uint64_t size)
{
    const auto rest = size % kBlockSize;
    return rest == 0U ? 0U : kBlockSize - rest;
}

} // namespace

ContainerPacker::ContainerPacker(std::ostream& sink, std::size_t chunkSize)
    : sink_(sink)
    , chunkSize_(chunkSize == 0 ? kBlockSize : chunkSize)
{
}

void ContainerPacker::addFile(const ContainerEntry& entry, std::istream& content)
{
    if (finished_) {
        throw std::logic_error("ContainerPacker::addFile called after finish");
    }

    writeHeader(entry, '0');

    std::vector<char> buffer(chunkSize_);
    auto remaining = entry.size;
    while (remaining > 0U) {
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        content.read(buffer.data(), static_cast<std::streamsize>(wanted));
        const auto got = static_cast<std::size_t>(content.gcount());
        if (got == 0U) {
            break;
        }
        writeRaw(buffer.data(), got);
        remaining -= got;
    }

    if (remaining > 0U) {
        std::fill(buffer.begin(), buffer.end(), '\0');
        const auto shortBy = remaining;
        while (remaining > 0U) {
            const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
            writeRaw(buffer.data(), count);
            remaining -= count;
        }
        writePadding(entry.size);
        ++entryCount_;
        writePaxHeader(entry.path, paxRecord(kIncompleteKey, entry.path), entry.modifiedTime);
        throw ShortEntryError("Content of " + entry.path + " ended " + std::to_string(shortBy)
                              + " bytes before its declared size");
    }

    writePadding(entry.size);
    ++entryCount_;
}

void ContainerPacker::addDirectory(const ContainerEntry& entry)
{
    if (finished_) {
        throw std::logic_error("ContainerPacker::addDirectory called after finish");
    }

    auto directory = entry;
    directory.size = 0;
    if (directory.path.empty() || directory.path.back() != '/') {
        directory.path.push_back('/');
    }
    writeHeader(directory, '5');
    ++entryCount_;
}

void ContainerPacker::finish()
{
    if (finished_) {
        return;
    }

    const Block zero {};
    writeBlock(zero.data());
    writeBlock(zero.data());
    sink_.flush();
    if (!sink_) {
        throw CompressionError("Failed to flush container stream");
    }
    finished_ = true;
}

std::size_t ContainerPacker::entryCount() const noexcept
{
    return entryCount_;
}

std::uint64_t ContainerPacker::bytesWritten() const noexcept
{
    return bytesWritten_;
}

void ContainerPacker::writeHeader(const ContainerEntry& entry, char typeFlag)
{
    if (entry.path.empty()) {
        throw std::invalid_argument("Container entry path is empty");
    }

    auto split = splitUstarPath(entry.path);
    if (!split) {
        writePaxHeader(entry.path, paxRecord("path", entry.path), entry.modifiedTime);
        split = std::make_pair(std::string {}, entry.path.substr(entry.path.size() - kNameFieldSize));
    }

    Block block {};
    copyField(block.data(), kNameFieldSize, split->second);
    writeOctal(block.data() + 100, 8, entry.mode & 07777U);
    writeOctal(block.data() + 108, 8, 0);
    writeOctal(block.data() + 116, 8, 0);
    if (entry.size > kMaxOctalSize) {
        writeBase256(block.data() + 124, 12, entry.size);
    } else {
        writeOctal(block.data() + 124, 12, entry.size);
    }
    writeOctal(block.data() + 136, 12, static_cast<std::uint64_t>(std::max<std::int64_t>(entry.modifiedTime, 0)));
    block[156] = typeFlag;
    copyField(block.data() + 157, kNameFieldSize, entry.linkTarget);
    std::memcpy(block.data() + 257, kUstarMagic, sizeof(kUstarMagic));
    std::memcpy(block.data() + 263, kUstarVersion, sizeof(kUstarVersion));
    copyField(block.data() + 345, kPrefixFieldSize, split->first);

    std::memset(block.data() + 148, ' ', 8);
    std::uint32_t checksum = 0;
    for (const auto byte : block) {
        checksum += static_cast<unsigned char>(byte);
    }
    writeOctal(block.data() + 148, 7, checksum);
    block[155] = ' ';

    writeBlock(block.data());
}

void ContainerPacker::writePaxHeader(const std::string& path, const std::string& payload, std::int64_t modifiedTime)
{
    const auto slash = path.rfind('/');
    auto base = slash == std::string::npos ? path : path.substr(slash + 1);
    if (base.size() > 80U) {
        base.resize(80U);
    }

    ContainerEntry pax {};
    pax.path = "PaxHeaders/" + base;
    pax.size = payload.size();
    pax.mode = 0644;
    pax.modifiedTime = modifiedTime;
    writeHeader(pax, 'x');
    writeRaw(payload.data(), payload.size());
    writePadding(payload.size());
}

void ContainerPacker::writeBlock(const char* block)
{
    writeRaw(block, kBlockSize);
}

void ContainerPacker::writeRaw(const char* data, std::size_t size)
{
    sink_.write(data, static_cast<std::streamsize>(size));
    if (!sink_) {
        throw CompressionError("Failed to write container record");
    }
    bytesWritten_ += size;
}

void ContainerPacker::writePadding(std::uint64_t contentSize)
{
    const auto padding = paddingFor(contentSize);
    if (padding > 0U) {
        const Block zero {};
        writeRaw(zero.data(), static_cast<std::size_t>(padding));
    }
}

} // namespace arcstream::container
