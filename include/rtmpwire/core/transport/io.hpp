#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "rtmpwire/core/transport/stream_concept.hpp"
#include "rtmpwire/core/transport/error.hpp"


namespace rtmpwire::core::transport {

// -----------------------------------------------------------------------------
// Exact-length helpers over a ByteReader / ByteWriter
// -----------------------------------------------------------------------------

// Reads exactly n bytes.
//   RemoteClosed      end of stream before the first byte
//   ShortRead         end of stream part-way through
//   TransportFailure  read() reported a failure
template<ByteReader R>
[[nodiscard]]
inline Error read_exact(R& in, char* buf, std::size_t n) noexcept {
    std::size_t got = 0;
    while (got < n) {
        const std::ptrdiff_t r = in.read(buf + got, n - got);
        if (r < 0) [[unlikely]] {
            return Error::TransportFailure;
        }
        if (r == 0) [[unlikely]] {
            return (got == 0) ? Error::RemoteClosed : Error::ShortRead;
        }
        got += static_cast<std::size_t>(r);
    }
    return Error::None;
}

template<ByteReader R>
[[nodiscard]]
inline Error read_exact(R& in, std::uint8_t* buf, std::size_t n) noexcept {
    return read_exact(in, reinterpret_cast<char*>(buf), n);
}

// Writes exactly n bytes.
template<ByteWriter W>
[[nodiscard]]
inline Error write_all(W& out, const char* buf, std::size_t n) noexcept {
    std::size_t sent = 0;
    while (sent < n) {
        const std::ptrdiff_t w = out.write(buf + sent, n - sent);
        if (w <= 0) [[unlikely]] {
            return Error::TransportFailure;
        }
        sent += static_cast<std::size_t>(w);
    }
    return Error::None;
}

template<ByteWriter W>
[[nodiscard]]
inline Error write_all(W& out, const std::uint8_t* buf, std::size_t n) noexcept {
    return write_all(out, reinterpret_cast<const char*>(buf), n);
}


// -----------------------------------------------------------------------------
// CountingStream - adds every transferred byte to an external counter
//
// Wraps one direction of a stream: the receive loop wraps its reads, the
// send loop its writes, each with its own counter.
// -----------------------------------------------------------------------------
template<class S>
class CountingStream {
public:
    CountingStream(S& stream, std::atomic<std::uint64_t>& counter) noexcept
        : stream_(stream)
        , counter_(counter)
    {}

    [[nodiscard]]
    inline std::ptrdiff_t read(char* buf, std::size_t n) noexcept
        requires ByteReader<S>
    {
        const std::ptrdiff_t r = stream_.read(buf, n);
        if (r > 0) {
            counter_.fetch_add(static_cast<std::uint64_t>(r), std::memory_order_relaxed);
        }
        return r;
    }

    [[nodiscard]]
    inline std::ptrdiff_t write(const char* buf, std::size_t n) noexcept
        requires ByteWriter<S>
    {
        const std::ptrdiff_t w = stream_.write(buf, n);
        if (w > 0) {
            counter_.fetch_add(static_cast<std::uint64_t>(w), std::memory_order_relaxed);
        }
        return w;
    }

private:
    S& stream_;
    std::atomic<std::uint64_t>& counter_;
};

} // namespace rtmpwire::core::transport
