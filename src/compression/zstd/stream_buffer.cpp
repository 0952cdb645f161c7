#include "compression/zstd/stream_buffer.hpp"

#include <stdexcept>

namespace arcstream::compression::zstd {

CompressingStreamBuf::CompressingStreamBuf(std::ostream& sink, int level, std::size_t workerThreads,
                                           std::size_t bufferSize)
    : compressor_(sink, level, workerThreads)
    , buffer_(bufferSize == 0 ? kDefaultChunkSize : bufferSize)
{
    setp(buffer_.data(), buffer_.data() + buffer_.size());
}

void CompressingStreamBuf::finish()
{
    drain();
    compressor_.finish();
}

std::uint64_t CompressingStreamBuf::bytesIn() const noexcept
{
    return compressor_.bytesIn() + static_cast<std::uint64_t>(pptr() - pbase());
}

std::uint64_t CompressingStreamBuf::bytesOut() const noexcept
{
    return compressor_.bytesOut();
}

CompressingStreamBuf::int_type CompressingStreamBuf::overflow(int_type ch)
{
    drain();
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }

    *pptr() = traits_type::to_char_type(ch);
    pbump(1);
    return ch;
}

std::streamsize CompressingStreamBuf::xsputn(const char* data, std::streamsize count)
{
    const auto available = epptr() - pptr();
    if (count <= available) {
        traits_type::copy(pptr(), data, static_cast<std::size_t>(count));
        pbump(static_cast<int>(count));
        return count;
    }

    drain();
    compressor_.write(data, static_cast<std::size_t>(count));
    return count;
}

int CompressingStreamBuf::sync()
{
    drain();
    compressor_.flush();
    return 0;
}

void CompressingStreamBuf::drain()
{
    const auto pending = pptr() - pbase();
    if (pending > 0) {
        compressor_.write(pbase(), static_cast<std::size_t>(pending));
    }
    setp(buffer_.data(), buffer_.data() + buffer_.size());
}

DecompressingStreamBuf::DecompressingStreamBuf(std::istream& source, std::size_t bufferSize)
    : decompressor_(source, bufferSize)
    , buffer_(bufferSize == 0 ? kDefaultChunkSize : bufferSize)
{
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

std::uint64_t DecompressingStreamBuf::bytesIn() const noexcept
{
    return decompressor_.bytesIn();
}

DecompressingStreamBuf::int_type DecompressingStreamBuf::underflow()
{
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    const auto got = decompressor_.read(buffer_.data(), buffer_.size());
    if (got == 0) {
        return traits_type::eof();
    }

    setg(buffer_.data(), buffer_.data(), buffer_.data() + got);
    return traits_type::to_int_type(*gptr());
}

} // namespace arcstream::compression::zstd
