#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"

namespace rtmpwire::core::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Mechanical facts observed by the multiplexing pipeline.
// Updated only through RW_TL1(); the byte counters used for acknowledgement
// bookkeeping are kept by the Connection itself and do not depend on this.
// ============================================================================

struct alignas(64) Connection final {
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    // start() accepted
    lcr::metrics::atomic::counter32 start_calls_total;

    // Command stream answered (Running -> Established)
    lcr::metrics::atomic::counter32 established_total;

    // close() invoked by user
    lcr::metrics::atomic::counter32 close_calls_total;

    // Transition into Disconnected (exactly once per connection)
    lcr::metrics::atomic::counter32 disconnect_events_total;

    // ---------------------------------------------------------------------
    // Receive path
    // ---------------------------------------------------------------------
    lcr::metrics::atomic::counter64 chunks_rx_total;
    lcr::metrics::atomic::counter64 messages_rx_total;

    // Inbound stream could not be decoded
    lcr::metrics::atomic::counter32 framing_errors_total;

    // Read failed or peer closed the stream
    lcr::metrics::atomic::counter32 receive_errors_total;

    // ---------------------------------------------------------------------
    // Dispatch
    // ---------------------------------------------------------------------

    // Messages popped by the dispatch loop
    lcr::metrics::atomic::counter64 messages_dispatched_total;

    // Messages forwarded to the application handler
    lcr::metrics::atomic::counter64 messages_delivered_total;

    // Protocol control messages acted upon / ignored
    lcr::metrics::atomic::counter64 control_handled_total;
    lcr::metrics::atomic::counter64 control_ignored_total;

    // Command stream messages
    lcr::metrics::atomic::counter64 command_messages_total;

    // Acknowledgements generated for the peer
    lcr::metrics::atomic::counter64 acks_sent_total;

    // ---------------------------------------------------------------------
    // Send path
    // ---------------------------------------------------------------------

    // send() called by user
    lcr::metrics::atomic::counter64 send_calls_total;

    // send() rejected (not running, or queue closed)
    lcr::metrics::atomic::counter64 send_rejected_total;

    lcr::metrics::atomic::counter64 chunks_tx_total;
    lcr::metrics::atomic::counter64 messages_tx_total;

    // Messages dropped by the send loop because they failed validation
    lcr::metrics::atomic::counter64 messages_invalid_total;

    // Write failed
    lcr::metrics::atomic::counter32 send_errors_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Connection& other) const noexcept {
        start_calls_total.copy_to(other.start_calls_total);
        established_total.copy_to(other.established_total);
        close_calls_total.copy_to(other.close_calls_total);
        disconnect_events_total.copy_to(other.disconnect_events_total);

        chunks_rx_total.copy_to(other.chunks_rx_total);
        messages_rx_total.copy_to(other.messages_rx_total);
        framing_errors_total.copy_to(other.framing_errors_total);
        receive_errors_total.copy_to(other.receive_errors_total);

        messages_dispatched_total.copy_to(other.messages_dispatched_total);
        messages_delivered_total.copy_to(other.messages_delivered_total);
        control_handled_total.copy_to(other.control_handled_total);
        control_ignored_total.copy_to(other.control_ignored_total);
        command_messages_total.copy_to(other.command_messages_total);
        acks_sent_total.copy_to(other.acks_sent_total);

        send_calls_total.copy_to(other.send_calls_total);
        send_rejected_total.copy_to(other.send_rejected_total);
        chunks_tx_total.copy_to(other.chunks_tx_total);
        messages_tx_total.copy_to(other.messages_tx_total);
        messages_invalid_total.copy_to(other.messages_invalid_total);
        send_errors_total.copy_to(other.send_errors_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n";

        os << "Lifecycle\n";
        os << "  Start calls           : " << start_calls_total.load() << '\n';
        os << "  Established           : " << established_total.load() << '\n';
        os << "  Close calls           : " << close_calls_total.load() << '\n';
        os << "  Disconnect events     : " << disconnect_events_total.load() << '\n';

        os << "\nReceive\n";
        os << "  Chunks                : " << chunks_rx_total.load() << '\n';
        os << "  Messages              : " << messages_rx_total.load() << '\n';
        os << "  Framing errors        : " << framing_errors_total.load() << '\n';
        os << "  Receive errors        : " << receive_errors_total.load() << '\n';

        os << "\nDispatch\n";
        os << "  Dispatched            : " << messages_dispatched_total.load() << '\n';
        os << "  Delivered             : " << messages_delivered_total.load() << '\n';
        os << "  Control handled       : " << control_handled_total.load() << '\n';
        os << "  Control ignored       : " << control_ignored_total.load() << '\n';
        os << "  Command messages      : " << command_messages_total.load() << '\n';
        os << "  Acks sent             : " << acks_sent_total.load() << '\n';

        os << "\nSend\n";
        os << "  Send calls            : " << send_calls_total.load() << '\n';
        os << "  Send rejected         : " << send_rejected_total.load() << '\n';
        os << "  Chunks                : " << chunks_tx_total.load() << '\n';
        os << "  Messages              : " << messages_tx_total.load() << '\n';
        os << "  Invalid messages      : " << messages_invalid_total.load() << '\n';
        os << "  Send errors           : " << send_errors_total.load() << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Connection>, "telemetry::Connection must be standard layout");
static_assert(std::is_trivially_destructible_v<Connection>, "telemetry::Connection must be trivially destructible");
static_assert(!std::is_polymorphic_v<Connection>, "telemetry::Connection must not be polymorphic");
static_assert(alignof(Connection) == 64, "telemetry::Connection must be cache-line aligned");

} // namespace rtmpwire::core::transport::telemetry
