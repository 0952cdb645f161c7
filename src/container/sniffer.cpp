#include "container/sniffer.hpp"

#include "container/types.hpp"

#include <algorithm>
#include <cstring>

namespace arcstream::container {
namespace {

using compression::zstd::PayloadKind;

constexpr char kMagic[] = "ustar";

// Strips NUL/space padding, then requires at least one octal digit and
// nothing else.
bool isOctalField(const std::uint8_t* field, std::size_t width)
{
    std::size_t begin = 0;
    std::size_t end = width;
    const auto isPadding = [](std::uint8_t byte) { return byte == 0U || byte == ' '; };

    while (begin < end && isPadding(field[begin])) {
        ++begin;
    }
    while (end > begin && isPadding(field[end - 1])) {
        --end;
    }
    if (begin == end) {
        return false;
    }

    return std::all_of(field + begin, field + end, [](std::uint8_t byte) { return byte >= '0' && byte <= '7'; });
}

bool hasContent(const std::uint8_t* field, std::size_t width)
{
    return std::any_of(field, field + width, [](std::uint8_t byte) { return byte != 0U && byte != ' '; });
}

} // namespace

PayloadKind classify(const std::uint8_t* data, std::size_t size)
{
    const auto window = std::min(size, kSniffWindow);
    const auto magicLength = sizeof(kMagic) - 1;
    const auto* end = data + window;
    if (std::search(data, end, kMagic, kMagic + magicLength) != end) {
        return PayloadKind::Container;
    }

    if (size < kSniffWindow) {
        return PayloadKind::SingleFile;
    }

    const auto* mode = data + 100;
    const auto* uid = data + 108;
    const auto* gid = data + 116;
    if (isOctalField(mode, 8) && isOctalField(uid, 8) && isOctalField(gid, 8)) {
        return PayloadKind::Container;
    }

    const auto* terminator = static_cast<const std::uint8_t*>(std::memchr(data, 0, kNameFieldSize));
    if (terminator != nullptr && terminator != data && hasContent(mode, 8)) {
        return PayloadKind::Container;
    }

    return PayloadKind::SingleFile;
}

PayloadKind classify(const std::vector<std::uint8_t>& data)
{
    return classify(data.data(), data.size());
}

} // namespace arcstream::container
