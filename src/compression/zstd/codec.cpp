#include "compression/zstd/codec.hpp"

#include "utils/errors.hpp"

#include <spdlog/spdlog.h>
#include <zstd.h>

#include <algorithm>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace arcstream::compression::zstd {

struct StreamCompressor::Context {
    ZSTD_CCtx* cctx {nullptr};

    ~Context()
    {
        ZSTD_freeCCtx(cctx);
    }
};

struct StreamDecompressor::Context {
    ZSTD_DCtx* dctx {nullptr};

    ~Context()
    {
        ZSTD_freeDCtx(dctx);
    }
};

namespace {

void checkCompressorResult(std::size_t code, const char* what)
{
    if (ZSTD_isError(code)) {
        throw CompressionError(std::string(what) + ": " + ZSTD_getErrorName(code));
    }
}

} // namespace

void validateLevel(int level)
{
    if (level < kMinLevel || level > kMaxLevel) {
        throw std::invalid_argument("Compression level must be between " + std::to_string(kMinLevel) + " and "
                                    + std::to_string(kMaxLevel) + ", got " + std::to_string(level));
    }
}

StreamCompressor::StreamCompressor(std::ostream& sink, int level, std::size_t workerThreads)
    : context_(std::make_unique<Context>())
    , sink_(sink)
    , outBuffer_(ZSTD_CStreamOutSize())
{
    validateLevel(level);

    context_->cctx = ZSTD_createCCtx();
    if (context_->cctx == nullptr) {
        throw CompressionError("Failed to allocate zstd compression context");
    }

    checkCompressorResult(ZSTD_CCtx_setParameter(context_->cctx, ZSTD_c_compressionLevel, level),
                          "Failed to set compression level");
    checkCompressorResult(ZSTD_CCtx_setParameter(context_->cctx, ZSTD_c_checksumFlag, 1),
                          "Failed to enable frame checksum");

    if (workerThreads > 1) {
        const auto result = ZSTD_CCtx_setParameter(context_->cctx, ZSTD_c_nbWorkers, static_cast<int>(workerThreads));
        if (ZSTD_isError(result)) {
            spdlog::debug("zstd built without multithreading, compressing on one thread ({})",
                          ZSTD_getErrorName(result));
        }
    }
}

StreamCompressor::~StreamCompressor() = default;

void StreamCompressor::write(const char* data, std::size_t size)
{
    if (finished_) {
        throw std::logic_error("StreamCompressor::write called after finish");
    }
    if (size == 0) {
        return;
    }
    drive(data, size, ZSTD_e_continue);
    bytesIn_ += size;
}

void StreamCompressor::flush()
{
    if (!finished_) {
        drive(nullptr, 0, ZSTD_e_flush);
    }
}

void StreamCompressor::finish()
{
    if (finished_) {
        return;
    }
    drive(nullptr, 0, ZSTD_e_end);
    finished_ = true;
}

bool StreamCompressor::finished() const noexcept
{
    return finished_;
}

std::uint64_t StreamCompressor::bytesIn() const noexcept
{
    return bytesIn_;
}

std::uint64_t StreamCompressor::bytesOut() const noexcept
{
    return bytesOut_;
}

void StreamCompressor::drive(const char* data, std::size_t size, int directive)
{
    const auto mode = static_cast<ZSTD_EndDirective>(directive);
    ZSTD_inBuffer input {data, size, 0};

    bool done = false;
    while (!done) {
        ZSTD_outBuffer output {outBuffer_.data(), outBuffer_.size(), 0};
        const auto remaining = ZSTD_compressStream2(context_->cctx, &output, &input, mode);
        checkCompressorResult(remaining, "zstd compression failed");

        if (output.pos > 0) {
            sink_.write(outBuffer_.data(), static_cast<std::streamsize>(output.pos));
            if (!sink_) {
                throw CompressionError("Failed to write compressed data");
            }
            bytesOut_ += output.pos;
        }

        done = mode == ZSTD_e_continue ? input.pos == input.size : remaining == 0;
    }
}

StreamDecompressor::StreamDecompressor(std::istream& source, std::size_t chunkSize)
    : context_(std::make_unique<Context>())
    , source_(source)
    , inBuffer_(chunkSize == 0 ? ZSTD_DStreamInSize() : chunkSize)
{
    context_->dctx = ZSTD_createDCtx();
    if (context_->dctx == nullptr) {
        throw DecompressionError("Failed to allocate zstd decompression context");
    }
}

StreamDecompressor::~StreamDecompressor() = default;

std::size_t StreamDecompressor::read(char* buffer, std::size_t size)
{
    if (size == 0 || finished_) {
        return 0;
    }

    ZSTD_outBuffer output {buffer, size, 0};

    while (true) {
        observeFrameStart();

        const bool hadInput = inPosition_ < inSize_;
        ZSTD_inBuffer input {inBuffer_.data(), inSize_, inPosition_};
        const auto hint = ZSTD_decompressStream(context_->dctx, &output, &input);
        if (ZSTD_isError(hint)) {
            throw DecompressionError(std::string("zstd decompression failed: ") + ZSTD_getErrorName(hint));
        }
        inPosition_ = input.pos;

        // With no input left zstd answers with the size of the next frame
        // header, which says nothing about the frame that just ended.
        if (hadInput) {
            lastHint_ = hint;
            if (hint == 0) {
                frameStart_ = bytesIn_ - inSize_ + inPosition_;
                magicFilled_ = 0;
                frameClassified_ = false;
            }
        }

        if (output.pos > 0) {
            break;
        }
        if (inPosition_ < inSize_) {
            continue;
        }
        if (!refill()) {
            if (bytesIn_ == 0) {
                throw DecompressionError("Compressed stream is empty");
            }
            if (lastHint_ != 0 || !sawDataFrame_) {
                throw DecompressionError("Compressed stream is truncated");
            }
            finished_ = true;
            return 0;
        }
    }

    bytesOut_ += output.pos;
    return output.pos;
}

std::uint64_t StreamDecompressor::bytesIn() const noexcept
{
    return bytesIn_;
}

std::uint64_t StreamDecompressor::bytesOut() const noexcept
{
    return bytesOut_;
}

void StreamDecompressor::observeFrameStart()
{
    if (frameClassified_) {
        return;
    }

    const auto base = bytesIn_ - inSize_;
    while (magicFilled_ < frameMagic_.size()) {
        const auto offset = frameStart_ + magicFilled_;
        if (offset < base || offset >= base + inSize_) {
            return;
        }
        frameMagic_[magicFilled_] = static_cast<std::uint8_t>(inBuffer_[static_cast<std::size_t>(offset - base)]);
        ++magicFilled_;
    }

    std::uint32_t magic = 0;
    for (std::size_t index = 0; index < frameMagic_.size(); ++index) {
        magic |= static_cast<std::uint32_t>(frameMagic_[index]) << (index * 8U);
    }
    if ((magic & ZSTD_MAGIC_SKIPPABLE_MASK) != ZSTD_MAGIC_SKIPPABLE_START) {
        sawDataFrame_ = true;
    }
    frameClassified_ = true;
}

bool StreamDecompressor::refill()
{
    if (sourceExhausted_) {
        return false;
    }

    source_.read(inBuffer_.data(), static_cast<std::streamsize>(inBuffer_.size()));
    const auto got = static_cast<std::size_t>(source_.gcount());
    if (source_.bad()) {
        throw DecompressionError("Failed to read compressed input");
    }
    if (got == 0) {
        sourceExhausted_ = true;
        return false;
    }

    inSize_ = got;
    inPosition_ = 0;
    bytesIn_ += got;
    return true;
}

std::uint64_t compressStream(std::istream& input,
                             std::ostream& output,
                             int level,
                             std::size_t chunkSize,
                             std::size_t workerThreads,
                             const ChunkObserver& observer)
{
    if (chunkSize == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }

    StreamCompressor compressor(output, level, workerThreads);
    std::vector<char> buffer(chunkSize);

    while (true) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = static_cast<std::size_t>(input.gcount());
        if (input.bad()) {
            throw CompressionError("Failed to read input stream");
        }
        if (got == 0) {
            break;
        }

        compressor.write(buffer.data(), got);
        if (observer) {
            observer(got);
        }
    }

    compressor.finish();
    output.flush();
    if (!output) {
        throw CompressionError("Failed to flush compressed output");
    }

    return compressor.bytesOut();
}

std::uint64_t decompressStream(std::istream& input,
                               std::ostream& output,
                               std::size_t chunkSize,
                               const ChunkObserver& observer)
{
    if (chunkSize == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }

    StreamDecompressor decompressor(input, chunkSize);
    std::vector<char> buffer(chunkSize);
    std::uint64_t written = 0;

    while (true) {
        const auto got = decompressor.read(buffer.data(), buffer.size());
        if (got == 0) {
            break;
        }

        output.write(buffer.data(), static_cast<std::streamsize>(got));
        if (!output) {
            throw ExtractionError("Failed to write decompressed data");
        }
        written += got;
        if (observer) {
            observer(got);
        }
    }

    output.flush();
    if (!output) {
        throw ExtractionError("Failed to flush decompressed output");
    }

    return written;
}

std::vector<std::uint8_t> peekDecompressed(std::istream& input, std::size_t limit)
{
    std::vector<std::uint8_t> sample(limit);
    if (limit == 0) {
        return sample;
    }

    StreamDecompressor decompressor(input, std::min<std::size_t>(limit, ZSTD_DStreamInSize()));
    std::size_t filled = 0;
    while (filled < limit) {
        const auto got = decompressor.read(reinterpret_cast<char*>(sample.data()) + filled, limit - filled);
        if (got == 0) {
            break;
        }
        filled += got;
    }

    sample.resize(filled);
    return sample;
}

} // namespace arcstream::compression::zstd
