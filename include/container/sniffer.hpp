#pragma once

#include "compression/zstd/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace arcstream::container {

inline constexpr std::size_t kSniffWindow = 512;

// Heuristic classification of the first decompressed bytes of an untagged
// stream. Unusual single files can be misclassified as containers.
compression::zstd::PayloadKind classify(const std::uint8_t* data, std::size_t size);
compression::zstd::PayloadKind classify(const std::vector<std::uint8_t>& data);

} // namespace arcstream::container
