#pragma once

#include "compression/zstd/types.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace arcstream::compression::zstd {

void writeFormatTag(std::ostream& output, PayloadKind kind);

// Consumes up to kTagFrameSize bytes; returns nullopt for untagged streams.
std::optional<PayloadKind> readFormatTag(std::istream& input);
std::optional<PayloadKind> readFormatTag(const std::filesystem::path& path);

} // namespace arcstream::compression::zstd
