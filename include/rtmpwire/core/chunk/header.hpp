#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>

#include "rtmpwire/core/chunk/format.hpp"
#include "rtmpwire/core/protocol/message_type.hpp"
#include "rtmpwire/core/protocol/chunk_stream_id.hpp"
#include "rtmpwire/core/config/protocol.hpp"
#include "rtmpwire/core/transport/stream_concept.hpp"
#include "rtmpwire/core/transport/io.hpp"
#include "rtmpwire/core/transport/error.hpp"
#include "lcr/endian.hpp"
#include "lcr/log/logger.hpp"


namespace rtmpwire::core::chunk {

/*
===============================================================================
 chunk::Header
===============================================================================

One chunk header as it appears on the wire: a basic header (format + chunk
stream id) followed by a format-dependent message header.

  format                 bytes   carries
  ---------------------  -----   ------------------------------------------
  Full                     11    timestamp(3 BE) length(3 BE) type(1) stream(4 LE)
  SameStream                7    delta(3 BE) length(3 BE) type(1)
  SameLengthAndStream       3    delta(3 BE)
  Continuation              0    -

Basic header forms:
  csid 2..63        1 byte   fmt<<6 | csid
  csid 64..319      2 bytes  fmt<<6 | 0,  csid - 64
  csid 320..65599   3 bytes  fmt<<6 | 1,  (csid - 64) little-endian 16-bit

When the 3-byte timestamp field equals 0xFFFFFF, a 4-byte big-endian extended
timestamp follows the message header and replaces it. Continuation headers
never carry one.

Fields a compressed header does not transmit are left at zero by decode();
filling them in from the chunk stream's previous header is the job of
resolve() in chunk_stream.hpp.
===============================================================================
*/

struct Header {
    HeaderFormat format{HeaderFormat::Full};
    std::uint32_t chunk_stream_id{0};
    std::uint32_t timestamp{0};          // absolute (Full) or delta (compressed)
    std::uint32_t message_length{0};
    protocol::MessageType message_type{protocol::MessageType::None};
    std::uint32_t message_stream_id{0};

    bool operator==(const Header&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Header& h) {
    return os << "{fmt=" << to_string(h.format)
              << " csid=" << h.chunk_stream_id
              << " ts=" << h.timestamp
              << " len=" << h.message_length
              << " type=" << to_string(h.message_type)
              << " msid=" << h.message_stream_id << "}";
}


// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------

// Serializes h into out (at least MAX_HEADER_SIZE bytes); size receives the
// number of bytes produced.
[[nodiscard]]
inline transport::Error encode(const Header& h, std::uint8_t* out, std::size_t& size) noexcept {
    using transport::Error;
    size = 0;
    if (!protocol::chunk_stream::is_valid(h.chunk_stream_id)) [[unlikely]] {
        return Error::InvalidChunkStreamId;
    }
    if (h.message_length > config::MAX_MESSAGE_LENGTH) [[unlikely]] {
        return Error::MessageTooLarge;
    }
    const auto fmt_bits = static_cast<std::uint8_t>(static_cast<std::uint8_t>(h.format) << 6);
    // Basic header
    std::size_t pos = 0;
    switch (basic_header_size(h.chunk_stream_id)) {
        case 1:
            out[pos++] = static_cast<std::uint8_t>(fmt_bits | h.chunk_stream_id);
            break;
        case 2:
            out[pos++] = fmt_bits;
            out[pos++] = static_cast<std::uint8_t>(h.chunk_stream_id - 64);
            break;
        default:
            out[pos++] = static_cast<std::uint8_t>(fmt_bits | 1);
            lcr::store_le16(out + pos, static_cast<std::uint16_t>(h.chunk_stream_id - 64));
            pos += 2;
            break;
    }
    // Message header
    const bool extended = h.format != HeaderFormat::Continuation &&
                          h.timestamp >= config::TIMESTAMP_EXTENDED;
    if (h.format != HeaderFormat::Continuation) {
        lcr::store_be24(out + pos, extended ? config::TIMESTAMP_EXTENDED : h.timestamp);
        pos += 3;
    }
    if (h.format == HeaderFormat::Full || h.format == HeaderFormat::SameStream) {
        lcr::store_be24(out + pos, h.message_length);
        pos += 3;
        out[pos++] = static_cast<std::uint8_t>(h.message_type);
    }
    if (h.format == HeaderFormat::Full) {
        lcr::store_le32(out + pos, h.message_stream_id);
        pos += 4;
    }
    if (extended) {
        lcr::store_be32(out + pos, h.timestamp);
        pos += 4;
    }
    size = pos;
    return Error::None;
}

// Encodes h and writes it as a single write.
template<transport::ByteWriter W>
[[nodiscard]]
inline transport::Error write_header(W& out, const Header& h) noexcept {
    std::uint8_t buf[MAX_HEADER_SIZE];
    std::size_t size = 0;
    const auto err = encode(h, buf, size);
    if (err != transport::Error::None) {
        return err;
    }
    return transport::write_all(out, buf, size);
}


// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------

namespace detail {

// Reads inside a header that has already started: EOF is a short read
template<transport::ByteReader R>
[[nodiscard]]
inline transport::Error read_rest(R& in, std::uint8_t* buf, std::size_t n) noexcept {
    const auto err = transport::read_exact(in, buf, n);
    return (err == transport::Error::RemoteClosed) ? transport::Error::ShortRead : err;
}

} // namespace detail

// Reads one chunk header.
//   RemoteClosed      stream ended cleanly before the header
//   ShortRead         stream ended inside the header
//   TransportFailure  read failed
template<transport::ByteReader R>
[[nodiscard]]
inline transport::Error read_header(R& in, Header& out) noexcept {
    using transport::Error;
    out = Header{};
    std::uint8_t buf[11];
    // Basic header
    auto err = transport::read_exact(in, buf, 1);
    if (err != Error::None) {
        return err;
    }
    out.format = static_cast<HeaderFormat>(buf[0] >> 6);
    const std::uint8_t low = buf[0] & 0x3F;
    if (low == 0) {
        if ((err = detail::read_rest(in, buf, 1)) != Error::None) return err;
        out.chunk_stream_id = 64u + buf[0];
    }
    else if (low == 1) {
        if ((err = detail::read_rest(in, buf, 2)) != Error::None) return err;
        out.chunk_stream_id = 64u + lcr::load_le16(buf);
    }
    else {
        out.chunk_stream_id = low;
    }
    // Message header
    const std::size_t size = message_header_size(out.format);
    if (size == 0) {
        return Error::None; // Continuation
    }
    if ((err = detail::read_rest(in, buf, size)) != Error::None) {
        return err;
    }
    out.timestamp = lcr::load_be24(buf);
    if (size >= 7) {
        out.message_length = lcr::load_be24(buf + 3);
        out.message_type = static_cast<protocol::MessageType>(buf[6]);
    }
    if (size == 11) {
        out.message_stream_id = lcr::load_le32(buf + 7);
    }
    // Extended timestamp
    if (out.timestamp == config::TIMESTAMP_EXTENDED) {
        if ((err = detail::read_rest(in, buf, 4)) != Error::None) return err;
        out.timestamp = lcr::load_be32(buf);
    }
    RW_TRACE("[HDR] decoded " << out);
    return Error::None;
}

} // namespace rtmpwire::core::chunk
