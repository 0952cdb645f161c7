#pragma once

#include <cstddef>
#include <cstdint>

namespace arcstream::compression::zstd {

inline constexpr int kMinLevel = 1;
inline constexpr int kMaxLevel = 22;
inline constexpr int kDefaultLevel = 3;
inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

// Skippable frame written in front of every archive we produce.
inline constexpr std::uint32_t kTagFrameMagic = 0x184D2A5AU;
inline constexpr char kTagMagic[4] = {'A', 'R', 'C', 'S'};
inline constexpr std::uint8_t kTagVersion = 1;
inline constexpr std::size_t kTagPayloadSize = 8;
inline constexpr std::size_t kTagFrameSize = 8 + kTagPayloadSize;

enum class PayloadKind : std::uint8_t {
    SingleFile = 1,
    Container = 2
};

const char* toString(PayloadKind kind) noexcept;

} // namespace arcstream::compression::zstd
