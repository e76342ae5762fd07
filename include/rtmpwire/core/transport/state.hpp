#pragma once

#include <cstdint>
#include <string_view>

#include "rtmpwire/core/transport/error.hpp"


namespace rtmpwire::core::transport {

// ===============================================================
// PIPELINE STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Idle,          // constructed, loops not started
    Running,       // loops running, waiting for the first command reply
    Established,   // command stream answered (connect accepted)
    Disconnected   // terminal
};

// ------------------------------------------------------------
// State → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Idle:         return "Idle";
        case State::Running:      return "Running";
        case State::Established:  return "Established";
        case State::Disconnected: return "Disconnected";
        default:                  return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    StartRequested,
    CloseRequested,

    // --- Peer activity ---
    CommandReceived,

    // --- Faults ---
    TransportFailed,
    FramingFault
};

// ===============================================================
// Event → string
// ===============================================================
[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::StartRequested:  return "StartRequested";
        case Event::CloseRequested:  return "CloseRequested";
        case Event::CommandReceived: return "CommandReceived";
        case Event::TransportFailed: return "TransportFailed";
        case Event::FramingFault:    return "FramingFault";
        default:                     return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : uint8_t {
    None,
    LocalClose,        // explicit close() by user
    TransportError,    // read / write failure or peer EOF
    FramingError       // inbound stream could not be decoded
};

// ------------------------------------------------------------
// DisconnectReason → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:           return "None";
        case DisconnectReason::LocalClose:     return "LocalClose";
        case DisconnectReason::TransportError: return "TransportError";
        case DisconnectReason::FramingError:   return "FramingError";
        default:                               return "Unknown";
    }
}

// Maps a fatal pipeline error to the event that reports it
[[nodiscard]]
inline constexpr Event to_event(Error err) noexcept {
    if (err == Error::LocalShutdown) return Event::CloseRequested;
    if (is_framing_fault(err))       return Event::FramingFault;
    return Event::TransportFailed;
}

} // namespace rtmpwire::core::transport
