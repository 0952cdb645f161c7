#include "compression/zstd/format_tag.hpp"

#include "utils/errors.hpp"

#include <array>
#include <cstring>
#include <fstream>

namespace arcstream::compression::zstd {
namespace {

void putLittleEndian32(std::uint8_t* destination, std::uint32_t value)
{
    for (std::size_t index = 0; index < 4; ++index) {
        destination[index] = static_cast<std::uint8_t>((value >> (index * 8U)) & 0xFFU);
    }
}

std::uint32_t getLittleEndian32(const std::uint8_t* source)
{
    std::uint32_t value = 0;
    for (std::size_t index = 0; index < 4; ++index) {
        value |= static_cast<std::uint32_t>(source[index]) << (index * 8U);
    }
    return value;
}

} // namespace

const char* toString(PayloadKind kind) noexcept
{
    switch (kind) {
    case PayloadKind::SingleFile:
        return "single file";
    case PayloadKind::Container:
        return "container";
    }
    return "unknown";
}

void writeFormatTag(std::ostream& output, PayloadKind kind)
{
    std::array<std::uint8_t, kTagFrameSize> frame {};
    putLittleEndian32(frame.data(), kTagFrameMagic);
    putLittleEndian32(frame.data() + 4, static_cast<std::uint32_t>(kTagPayloadSize));
    std::memcpy(frame.data() + 8, kTagMagic, sizeof(kTagMagic));
    frame[12] = kTagVersion;
    frame[13] = static_cast<std::uint8_t>(kind);

    output.write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
    if (!output) {
        throw CompressionError("Failed to write archive format tag");
    }
}

std::optional<PayloadKind> readFormatTag(std::istream& input)
{
    std::array<std::uint8_t, kTagFrameSize> frame {};
    input.read(reinterpret_cast<char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
    if (input.gcount() != static_cast<std::streamsize>(frame.size())) {
        return std::nullopt;
    }

    if (getLittleEndian32(frame.data()) != kTagFrameMagic
        || getLittleEndian32(frame.data() + 4) != kTagPayloadSize
        || std::memcmp(frame.data() + 8, kTagMagic, sizeof(kTagMagic)) != 0
        || frame[12] != kTagVersion) {
        return std::nullopt;
    }

    switch (frame[13]) {
    case static_cast<std::uint8_t>(PayloadKind::SingleFile):
        return PayloadKind::SingleFile;
    case static_cast<std::uint8_t>(PayloadKind::Container):
        return PayloadKind::Container;
    default:
        return std::nullopt;
    }
}

std::optional<PayloadKind> readFormatTag(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ExtractionError("Failed to open archive: " + path.string());
    }
    return readFormatTag(input);
}

} // namespace arcstream::compression::zstd
