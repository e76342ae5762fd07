#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include "rtmpwire/core/transport/stream_concept.hpp"


namespace rtmpwire::test {

// -----------------------------------------------------------------------------
// MemoryStream - single-threaded in-memory byte stream
//
// Reads consume the preloaded input (optionally at most max_read bytes per
// call, to exercise partial reads) and return 0 at the end. Writes append to
// output; write_budget makes writes fail after that many bytes.
// -----------------------------------------------------------------------------
class MemoryStream {
public:
    MemoryStream() = default;

    explicit MemoryStream(std::vector<std::uint8_t> input, std::size_t max_read = 0)
        : input_(std::move(input))
        , max_read_(max_read)
    {}

    std::ptrdiff_t read(char* buf, std::size_t n) noexcept {
        if (fail_reads_) {
            return -1;
        }
        std::size_t avail = input_.size() - pos_;
        if (avail == 0) {
            return 0;
        }
        std::size_t take = std::min(n, avail);
        if (max_read_ > 0) {
            take = std::min(take, max_read_);
        }
        std::memcpy(buf, input_.data() + pos_, take);
        pos_ += take;
        ++read_calls_;
        return static_cast<std::ptrdiff_t>(take);
    }

    std::ptrdiff_t write(const char* buf, std::size_t n) noexcept {
        if (write_budget_ == 0) {
            return -1;
        }
        const std::size_t take = std::min(n, write_budget_);
        output_.insert(output_.end(), reinterpret_cast<const std::uint8_t*>(buf),
                       reinterpret_cast<const std::uint8_t*>(buf) + take);
        write_budget_ -= take;
        ++write_calls_;
        return static_cast<std::ptrdiff_t>(take);
    }

    void close() noexcept { ++close_calls_; }

    // Test controls
    void append_input(const std::vector<std::uint8_t>& bytes) {
        input_.insert(input_.end(), bytes.begin(), bytes.end());
    }
    void set_fail_reads(bool on) noexcept { fail_reads_ = on; }
    void set_write_budget(std::size_t bytes) noexcept { write_budget_ = bytes; }

    const std::vector<std::uint8_t>& output() const noexcept { return output_; }
    std::size_t remaining_input() const noexcept { return input_.size() - pos_; }
    std::size_t read_calls() const noexcept { return read_calls_; }
    std::size_t write_calls() const noexcept { return write_calls_; }
    std::size_t close_calls() const noexcept { return close_calls_; }

private:
    std::vector<std::uint8_t> input_;
    std::size_t pos_ = 0;
    std::size_t max_read_ = 0;
    bool fail_reads_ = false;

    std::vector<std::uint8_t> output_;
    std::size_t write_budget_ = static_cast<std::size_t>(-1);

    std::size_t read_calls_ = 0;
    std::size_t write_calls_ = 0;
    std::size_t close_calls_ = 0;
};

static_assert(core::transport::ByteStreamConcept<MemoryStream>);

} // namespace rtmpwire::test
