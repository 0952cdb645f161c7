#pragma once

#include "compression/zstd/codec.hpp"

#include <cstddef>
#include <streambuf>
#include <vector>

namespace arcstream::compression::zstd {

// Output buffer that compresses everything written through it.
class CompressingStreamBuf : public std::streambuf {
public:
    CompressingStreamBuf(std::ostream& sink, int level, std::size_t workerThreads = 0,
                         std::size_t bufferSize = kDefaultChunkSize);

    CompressingStreamBuf(const CompressingStreamBuf&) = delete;
    CompressingStreamBuf& operator=(const CompressingStreamBuf&) = delete;

    // Flushes pending bytes and writes the frame epilogue.
    void finish();

    std::uint64_t bytesIn() const noexcept;
    std::uint64_t bytesOut() const noexcept;

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* data, std::streamsize count) override;
    int sync() override;

private:
    void drain();

    StreamCompressor compressor_;
    std::vector<char> buffer_;
};

// Input buffer that yields the decompressed bytes of a zstd stream.
class DecompressingStreamBuf : public std::streambuf {
public:
    explicit DecompressingStreamBuf(std::istream& source, std::size_t bufferSize = kDefaultChunkSize);

    DecompressingStreamBuf(const DecompressingStreamBuf&) = delete;
    DecompressingStreamBuf& operator=(const DecompressingStreamBuf&) = delete;

    std::uint64_t bytesIn() const noexcept;

protected:
    int_type underflow() override;

private:
    StreamDecompressor decompressor_;
    std::vector<char> buffer_;
};

} // namespace arcstream::compression::zstd
