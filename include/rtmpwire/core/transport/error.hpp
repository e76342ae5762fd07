#pragma once

#include <string_view>

namespace rtmpwire::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Error classification shared by the byte-stream layer, the chunk codec and the
multiplexing pipeline.

It abstracts away platform error codes (errno, getaddrinfo) and keeps the set
small and stable. Codec and I/O functions return it by value; the pipeline
records the first fatal one and reports it through on_disconnect().
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,           // Malformed or unsupported URL (scheme, host, port)
    InvalidState,         // Operation not allowed in current pipeline state
    InvalidMessage,       // Outbound message is inconsistent (length vs payload)
    InvalidChunkStreamId, // Chunk stream id outside the encodable range
    MessageTooLarge,      // Message length does not fit the 24-bit field

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,        // Connection was closed intentionally by the local endpoint
    RemoteClosed,         // Remote endpoint closed the byte stream (EOF on a boundary)

    // --- Connection setup ---------------------------------------------------
    ConnectionFailed,     // DNS resolution or TCP connect failed
    HandshakeFailed,      // Handshake exchange failed or peer version unsupported

    // --- Framing faults (stream no longer decodable) ------------------------
    ShortRead,            // Stream ended in the middle of a header or payload
    MissingPreviousHeader,// Compressed header with no prior header on its chunk stream
    ProtocolError,        // Any other wire-level violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure,     // Read or write failed at the OS level
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                  return "None";
    case Error::InvalidUrl:            return "InvalidUrl";
    case Error::InvalidState:          return "InvalidState";
    case Error::InvalidMessage:        return "InvalidMessage";
    case Error::InvalidChunkStreamId:  return "InvalidChunkStreamId";
    case Error::MessageTooLarge:       return "MessageTooLarge";
    case Error::LocalShutdown:         return "LocalShutdown";
    case Error::RemoteClosed:          return "RemoteClosed";
    case Error::ConnectionFailed:      return "ConnectionFailed";
    case Error::HandshakeFailed:       return "HandshakeFailed";
    case Error::ShortRead:             return "ShortRead";
    case Error::MissingPreviousHeader: return "MissingPreviousHeader";
    case Error::ProtocolError:         return "ProtocolError";
    case Error::TransportFailure:      return "TransportFailure";
    default:                           return "Unknown";
    }
}

// The inbound stream can no longer be decoded
[[nodiscard]]
inline constexpr bool is_framing_fault(Error err) noexcept {
    return err == Error::ShortRead
        || err == Error::MissingPreviousHeader
        || err == Error::ProtocolError;
}

// The byte stream itself is gone
[[nodiscard]]
inline constexpr bool is_transport_fault(Error err) noexcept {
    return err == Error::RemoteClosed
        || err == Error::TransportFailure
        || err == Error::ConnectionFailed;
}

} // namespace transport
} // namespace rtmpwire::core
