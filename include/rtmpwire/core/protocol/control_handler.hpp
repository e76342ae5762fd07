#pragma once

#include <cstdint>
#include <optional>

#include "rtmpwire/core/chunk/message.hpp"
#include "rtmpwire/core/chunk/reassembler.hpp"
#include "rtmpwire/core/protocol/control.hpp"
#include "rtmpwire/core/protocol/parameters.hpp"
#include "rtmpwire/core/protocol/message_type.hpp"
#include "rtmpwire/core/protocol/chunk_stream_id.hpp"
#include "rtmpwire/core/transport/telemetry/connection.hpp"
#include "rtmpwire/core/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace rtmpwire::core::protocol {

/*
===============================================================================
 protocol::ControlHandler
===============================================================================

Interprets protocol control messages (chunk stream 2) for one connection.

Two entry points, one per pipeline thread:

  apply_framing()  receive loop, right after a message completes.
                   ChunkSize and Abort change how the following chunks are
                   read, so they take effect before the next header.

  handle()         dispatch loop, for every protocol-stream message.
                   Records acknowledgement windows, peer bandwidth and peer
                   acknowledgements; answers ping requests through reply.

Malformed payloads and unknown types are logged and ignored; they never tear
the connection down.
===============================================================================
*/

class ControlHandler {
public:
    ControlHandler(Parameters& params, transport::telemetry::Connection& telemetry) noexcept
        : params_(params)
        , telemetry_(telemetry)
    {}

    [[nodiscard]]
    static inline bool affects_framing(const chunk::Message& msg) noexcept {
        return msg.chunk_stream_id == chunk_stream::Protocol &&
               (msg.type == MessageType::ChunkSize || msg.type == MessageType::Abort);
    }

    // Returns true if msg was a framing message (applied or rejected).
    inline bool apply_framing(const chunk::Message& msg, chunk::Reassembler& reassembler) noexcept {
        if (!affects_framing(msg)) {
            return false;
        }
        if (msg.type == MessageType::ChunkSize) {
            std::uint32_t size = 0;
            if (!parse_chunk_size(msg, size)) {
                RW_WARN("[CTRL] Ignoring malformed chunk size message (" << msg.buffer.size() << " bytes)");
                return true;
            }
            const auto previous = params_.in_chunk_size.exchange(size, std::memory_order_acq_rel);
            RW_DEBUG("[CTRL] Inbound chunk size " << previous << " -> " << size);
            return true;
        }
        std::uint32_t target = 0;
        if (!parse_u32(msg, target)) {
            RW_WARN("[CTRL] Ignoring malformed abort message");
            return true;
        }
        if (reassembler.abort(target)) {
            RW_DEBUG("[CTRL] Aborted partial message on chunk stream " << target);
        }
        return true;
    }

    inline void handle(const chunk::Message& msg, std::optional<chunk::Message>& reply) noexcept {
        reply.reset();
        switch (msg.type) {
            case MessageType::ChunkSize:
            case MessageType::Abort:
                // Already applied by the receive loop
                RW_TL1( telemetry_.control_handled_total.inc() );
                return;

            case MessageType::Ack: {
                std::uint32_t seq = 0;
                if (!parse_u32(msg, seq)) break;
                params_.peer_acknowledged.store(seq, std::memory_order_relaxed);
                RW_TRACE("[CTRL] Peer acknowledged " << seq << " bytes");
                RW_TL1( telemetry_.control_handled_total.inc() );
                return;
            }

            case MessageType::AckSize: {
                std::uint32_t window = 0;
                if (!parse_u32(msg, window)) break;
                params_.in_window_size.store(window, std::memory_order_relaxed);
                RW_DEBUG("[CTRL] Acknowledgement window set to " << window);
                RW_TL1( telemetry_.control_handled_total.inc() );
                return;
            }

            case MessageType::Bandwidth: {
                std::uint32_t window = 0;
                BandwidthLimit limit = BandwidthLimit::Dynamic;
                if (!parse_peer_bandwidth(msg, window, limit)) break;
                params_.peer_bandwidth.store(window, std::memory_order_relaxed);
                params_.peer_bandwidth_limit.store(limit, std::memory_order_relaxed);
                RW_DEBUG("[CTRL] Peer bandwidth " << window << " (" << to_string(limit) << ")");
                RW_TL1( telemetry_.control_handled_total.inc() );
                return;
            }

            case MessageType::Ping: {
                UserControlEvent event{};
                std::uint32_t value = 0;
                if (!parse_user_control(msg, event, value)) break;
                if (event == UserControlEvent::PingRequest) {
                    RW_TRACE("[CTRL] Ping request " << value);
                    reply.emplace(make_user_control(UserControlEvent::PingResponse, value));
                }
                else {
                    RW_DEBUG("[CTRL] User control " << to_string(event) << " (" << value << ")");
                }
                RW_TL1( telemetry_.control_handled_total.inc() );
                return;
            }

            default:
                RW_DEBUG("[CTRL] Ignoring " << to_string(msg.type) << " on protocol stream");
                RW_TL1( telemetry_.control_ignored_total.inc() );
                return;
        }
        RW_WARN("[CTRL] Ignoring malformed " << to_string(msg.type) << " message (" << msg.buffer.size() << " bytes)");
        RW_TL1( telemetry_.control_ignored_total.inc() );
    }

private:
    Parameters& params_;
    [[maybe_unused]] transport::telemetry::Connection& telemetry_;
};

} // namespace rtmpwire::core::protocol
