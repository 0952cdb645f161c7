#pragma once

#include "compression/zstd/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <vector>

namespace arcstream::compression::zstd {

// Called once per processed chunk with the number of input bytes consumed.
using ChunkObserver = std::function<void(std::size_t)>;

void validateLevel(int level);

class StreamCompressor {
public:
    StreamCompressor(std::ostream& sink, int level, std::size_t workerThreads = 0);
    ~StreamCompressor();

    StreamCompressor(const StreamCompressor&) = delete;
    StreamCompressor& operator=(const StreamCompressor&) = delete;

    void write(const char* data, std::size_t size);
    void flush();
    void finish();

    bool finished() const noexcept;
    std::uint64_t bytesIn() const noexcept;
    std::uint64_t bytesOut() const noexcept;

private:
    struct Context;

    void drive(const char* data, std::size_t size, int directive);

    std::unique_ptr<Context> context_;
    std::ostream& sink_;
    std::vector<char> outBuffer_;
    std::uint64_t bytesIn_ {0};
    std::uint64_t bytesOut_ {0};
    bool finished_ {false};
};

class StreamDecompressor {
public:
    explicit StreamDecompressor(std::istream& source, std::size_t chunkSize = kDefaultChunkSize);
    ~StreamDecompressor();

    StreamDecompressor(const StreamDecompressor&) = delete;
    StreamDecompressor& operator=(const StreamDecompressor&) = delete;

    // Returns 0 once the compressed source is exhausted.
    std::size_t read(char* buffer, std::size_t size);

    std::uint64_t bytesIn() const noexcept;
    std::uint64_t bytesOut() const noexcept;

private:
    struct Context;

    bool refill();
    // Records whether the frame starting at frameStart_ carries data or is
    // a skippable frame.
    void observeFrameStart();

    std::unique_ptr<Context> context_;
    std::istream& source_;
    std::vector<char> inBuffer_;
    std::size_t inSize_ {0};
    std::size_t inPosition_ {0};
    std::size_t lastHint_ {0};
    std::uint64_t bytesIn_ {0};
    std::uint64_t bytesOut_ {0};
    std::uint64_t frameStart_ {0};
    std::array<std::uint8_t, 4> frameMagic_ {};
    std::size_t magicFilled_ {0};
    bool frameClassified_ {false};
    bool sawDataFrame_ {false};
    bool sourceExhausted_ {false};
    bool finished_ {false};
};

std::uint64_t compressStream(std::istream& input,
                             std::ostream& output,
                             int level,
                             std::size_t chunkSize = kDefaultChunkSize,
                             std::size_t workerThreads = 0,
                             const ChunkObserver& observer = {});

std::uint64_t decompressStream(std::istream& input,
                               std::ostream& output,
                               std::size_t chunkSize = kDefaultChunkSize,
                               const ChunkObserver& observer = {});

// Reads up to `limit` decompressed bytes from the start of a stream.
std::vector<std::uint8_t> peekDecompressed(std::istream& input, std::size_t limit);

} // namespace arcstream::compression::zstd
