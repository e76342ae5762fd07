#pragma once

#include <atomic>
#include <cstddef>
#include <string>

#include "rtmpwire/core/transport/stream_concept.hpp"
#include "rtmpwire/core/transport/error.hpp"


namespace rtmpwire::core::transport::tcp {

// -----------------------------------------------------------------------------
// SocketStream - blocking POSIX TCP byte stream
//
// close() shuts the socket down (both directions) exactly once, which wakes
// any thread blocked in read() or write(). The descriptor itself is released
// by the destructor, once no loop can still be using it.
// -----------------------------------------------------------------------------
class SocketStream {
public:
    SocketStream() noexcept = default;
    ~SocketStream();

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    // Resolves host and connects to the first reachable address
    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port) noexcept;

    [[nodiscard]]
    std::ptrdiff_t read(char* buf, std::size_t n) noexcept;

    [[nodiscard]]
    std::ptrdiff_t write(const char* buf, std::size_t n) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool is_open() const noexcept {
        return fd_ >= 0 && !closed_.load(std::memory_order_acquire);
    }

private:
    int fd_ = -1;
    std::atomic<bool> closed_{false};
};

static_assert(ByteStreamConcept<SocketStream>, "SocketStream must satisfy ByteStreamConcept");

} // namespace rtmpwire::core::transport::tcp
