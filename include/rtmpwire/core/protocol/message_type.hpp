#pragma once

#include <cstdint>
#include <string_view>


namespace rtmpwire::core::protocol {

// ===============================================================
// MESSAGE TYPE IDS
// One byte in FULL and SAME_STREAM message headers.
// Values outside this list are carried through untouched.
// ===============================================================
enum class MessageType : uint8_t {
    None              = 0x00,
    ChunkSize         = 0x01,
    Abort             = 0x02,
    Ack               = 0x03,
    Ping              = 0x04, // user control
    AckSize           = 0x05, // window acknowledgement size
    Bandwidth         = 0x06, // set peer bandwidth
    Audio             = 0x08,
    Video             = 0x09,
    Flex              = 0x0F,
    Amf3SharedObject  = 0x10,
    Amf3              = 0x11,
    Invoke            = 0x12,
    Amf0SharedObject  = 0x13,
    Amf0              = 0x14,
    Flv               = 0x16
};

[[nodiscard]]
inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::None:             return "None";
        case MessageType::ChunkSize:        return "ChunkSize";
        case MessageType::Abort:            return "Abort";
        case MessageType::Ack:              return "Ack";
        case MessageType::Ping:             return "Ping";
        case MessageType::AckSize:          return "AckSize";
        case MessageType::Bandwidth:        return "Bandwidth";
        case MessageType::Audio:            return "Audio";
        case MessageType::Video:            return "Video";
        case MessageType::Flex:             return "Flex";
        case MessageType::Amf3SharedObject: return "Amf3SharedObject";
        case MessageType::Amf3:             return "Amf3";
        case MessageType::Invoke:           return "Invoke";
        case MessageType::Amf0SharedObject: return "Amf0SharedObject";
        case MessageType::Amf0:             return "Amf0";
        case MessageType::Flv:              return "Flv";
        default:                            return "Unknown";
    }
}

// Protocol control types handled by the chunk layer itself
[[nodiscard]]
inline constexpr bool is_control(MessageType t) noexcept {
    const auto v = static_cast<uint8_t>(t);
    return v >= 0x01 && v <= 0x06;
}

} // namespace rtmpwire::core::protocol
