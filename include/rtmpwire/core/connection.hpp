#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <initializer_list>
#include <optional>
#include <thread>

#include "rtmpwire/core/handler_concept.hpp"
#include "rtmpwire/core/chunk/message.hpp"
#include "rtmpwire/core/chunk/reassembler.hpp"
#include "rtmpwire/core/chunk/fragmenter.hpp"
#include "rtmpwire/core/protocol/control.hpp"
#include "rtmpwire/core/protocol/control_handler.hpp"
#include "rtmpwire/core/protocol/parameters.hpp"
#include "rtmpwire/core/protocol/chunk_stream_id.hpp"
#include "rtmpwire/core/config/protocol.hpp"
#include "rtmpwire/core/config/queue_sizes.hpp"
#include "rtmpwire/core/transport/stream_concept.hpp"
#include "rtmpwire/core/transport/io.hpp"
#include "rtmpwire/core/transport/state.hpp"
#include "rtmpwire/core/transport/error.hpp"
#include "rtmpwire/core/transport/telemetry/connection.hpp"
#include "rtmpwire/core/telemetry.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/sync/bounded_queue.hpp"
#include "lcr/adaptive_backoff_until.hpp"
#include "lcr/log/logger.hpp"


namespace rtmpwire::core {

/*
===============================================================================
 rtmpwire::core::Connection
===============================================================================

Chunk-stream multiplexing pipeline over one already-open byte stream.

The Connection owns three threads for its whole lifetime:

  receive loop    reads chunks, reassembles messages, applies inbound framing
                  control (chunk size, abort) and hands completed messages to
                  the dispatch ring. Blocks (adaptive backoff) when the ring is
                  full: the peer is slowed down, nothing is dropped.

  dispatch loop   routes completed messages by chunk stream id:
                    2  protocol control  -> protocol::ControlHandler
                    3  command           -> establishes the connection
                    *  everything else   -> Handler::on_receive()
                  and acknowledges received bytes once per peer window.

  send loop       drains the outbound queue, fragments each message into
                  chunks of the current outbound chunk size and writes them.

-------------------------------------------------------------------------------
 Shutdown
-------------------------------------------------------------------------------
The first fatal event wins: a read fault, a framing fault, a write fault or a
local close(). It moves the state to Disconnected exactly once, records the
error, closes the byte stream (unblocking the receive loop) and the outbound
queue (unblocking the send loop and any blocked send()).

The dispatch loop keeps delivering the messages the receive loop already
completed, then reports on_disconnect() once. Handler callbacks therefore
never overlap and on_disconnect() is always the last one.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
- send(), set_chunk_size(), close() and the accessors are thread-safe.
- close() called from a handler callback initiates shutdown without joining;
  the destructor joins. Never destroy a Connection from a handler callback.
- The byte stream and handler must outlive the Connection.

===============================================================================
*/

template <
    transport::ByteStreamConcept Stream,
    HandlerConcept Handler
>
class Connection {
    using Error            = transport::Error;
    using State            = transport::State;
    using Event            = transport::Event;
    using DisconnectReason = transport::DisconnectReason;

public:
    Connection(Stream& stream, Handler& handler, transport::telemetry::Connection& telemetry) noexcept
        : stream_(stream)
        , handler_(handler)
        , telemetry_(telemetry)
        , control_(params_, telemetry)
        , outbound_(config::OUTBOUND_QUEUE_CAPACITY)
    {}

    ~Connection() {
        close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Starts the receive, dispatch and send loops.
    [[nodiscard]]
    inline Error start() noexcept {
        if (!transition_(Event::StartRequested)) {
            RW_WARN("[CONN] start() called while " << to_string(state()) << ". Ignoring.");
            return Error::InvalidState;
        }
        RW_TL1( telemetry_.start_calls_total.inc() );
        recv_thread_     = std::thread(&Connection::receive_loop_, this);
        dispatch_thread_ = std::thread(&Connection::dispatch_loop_, this);
        send_thread_     = std::thread(&Connection::send_loop_, this);
        RW_INFO("[CONN] Pipeline started (chunk size " << params_.in_chunk_size.load() << ")");
        return Error::None;
    }

    // Idempotent. Joins the loops unless called from one of them.
    inline void close() noexcept {
        RW_TL1( telemetry_.close_calls_total.inc() );
        (void)transition_(Event::CloseRequested, Error::LocalShutdown);
        join_loops_();
    }

    // Queues a complete message for sending. Blocks while the outbound queue
    // is full. Returns false if the message is invalid or the pipeline is not
    // (or no longer) running.
    [[nodiscard]]
    inline bool send(chunk::Message msg) noexcept {
        RW_TL1( telemetry_.send_calls_total.inc() );
        if (!is_active_()) {
            RW_WARN("[CONN] send() called while " << to_string(state()) << ". Ignoring.");
            RW_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        if (!protocol::chunk_stream::is_valid(msg.chunk_stream_id) ||
            msg.length > config::MAX_MESSAGE_LENGTH ||
            msg.buffer.size() != msg.length) [[unlikely]]
        {
            RW_WARN("[CONN] send() rejected invalid message (csid " << msg.chunk_stream_id << ", length " << msg.length
                    << ", payload " << msg.buffer.size() << ")");
            RW_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        if (!enqueue_(std::move(msg))) {
            RW_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        return true;
    }

    // Renegotiates the outbound chunk size. Messages queued after this call
    // are chunked with the new size.
    [[nodiscard]]
    inline bool set_chunk_size(std::uint32_t size) noexcept {
        if (size == 0 || size > config::MAX_CHUNK_SIZE) {
            RW_WARN("[CONN] Invalid chunk size " << size);
            return false;
        }
        RW_DEBUG("[CONN] Requesting outbound chunk size " << size);
        return send(protocol::make_set_chunk_size(size));
    }

    // Announces how many bytes the peer may send before it must acknowledge.
    [[nodiscard]]
    inline bool set_window_ack_size(std::uint32_t window) noexcept {
        if (window == 0) {
            RW_WARN("[CONN] Invalid acknowledgement window 0");
            return false;
        }
        return send(protocol::make_window_ack_size(window));
    }

    // Accessors
    [[nodiscard]]
    inline State state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline bool is_established() const noexcept {
        return state() == State::Established;
    }

    [[nodiscard]]
    inline std::uint32_t in_chunk_size() const noexcept {
        return params_.in_chunk_size.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline std::uint32_t out_chunk_size() const noexcept {
        return params_.out_chunk_size.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline std::uint32_t in_window_size() const noexcept {
        return params_.in_window_size.load(std::memory_order_relaxed);
    }

    [[nodiscard]]
    inline std::uint32_t out_window_size() const noexcept {
        return params_.out_window_size.load(std::memory_order_relaxed);
    }

    [[nodiscard]]
    inline std::uint32_t peer_bandwidth() const noexcept {
        return params_.peer_bandwidth.load(std::memory_order_relaxed);
    }

    [[nodiscard]]
    inline std::uint32_t peer_acknowledged() const noexcept {
        return params_.peer_acknowledged.load(std::memory_order_relaxed);
    }

    [[nodiscard]]
    inline std::uint64_t bytes_in() const noexcept {
        return bytes_in_.load(std::memory_order_relaxed);
    }

    [[nodiscard]]
    inline std::uint64_t bytes_out() const noexcept {
        return bytes_out_.load(std::memory_order_relaxed);
    }

    // Meaningful once state() is Disconnected
    [[nodiscard]]
    inline Error last_error() const noexcept {
        return last_error_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline DisconnectReason disconnect_reason() const noexcept {
        return reason_.load(std::memory_order_acquire);
    }

private:
    // ---------------------------------------------------------------------
    // Receive loop
    // ---------------------------------------------------------------------
    inline void receive_loop_() noexcept {
        RW_DEBUG("[RX] Receive loop started");
        transport::CountingStream<Stream> in{stream_, bytes_in_};
        std::optional<chunk::Message> completed;
        while (is_active_()) {
            const std::uint32_t chunk_size = params_.in_chunk_size.load(std::memory_order_acquire);
            const Error err = reassembler_.read_chunk(in, chunk_size, completed);
            if (err != Error::None) [[unlikely]] {
                on_receive_error_(err);
                break;
            }
            RW_TL1( telemetry_.chunks_rx_total.inc() );
            if (!completed) {
                continue;
            }
            RW_TL1( telemetry_.messages_rx_total.inc() );
            RW_TRACE("[RX] " << to_string(completed->type) << " csid=" << completed->chunk_stream_id
                     << " len=" << completed->length << " ts=" << completed->absolute_timestamp);
            // Must take effect before the next header is read
            (void)control_.apply_framing(*completed, reassembler_);
            if (!push_dispatch_(std::move(*completed))) {
                break;
            }
            completed.reset();
        }
        rx_done_.store(true, std::memory_order_release);
        RW_DEBUG("[RX] Receive loop stopped");
    }

    inline void on_receive_error_(Error err) noexcept {
        if (!is_active_()) {
            return; // stream closed by someone else's shutdown
        }
        if (transport::is_framing_fault(err)) {
            RW_ERROR("[RX] Framing fault: " << to_string(err));
            RW_TL1( telemetry_.framing_errors_total.inc() );
        }
        else if (err == Error::RemoteClosed) {
            RW_INFO("[RX] Connection closed by peer");
            RW_TL1( telemetry_.receive_errors_total.inc() );
        }
        else {
            RW_ERROR("[RX] Receive failed: " << to_string(err));
            RW_TL1( telemetry_.receive_errors_total.inc() );
        }
        (void)transition_(transport::to_event(err), err);
    }

    // Blocks while the dispatch ring is full; false once the pipeline stops
    inline bool push_dispatch_(chunk::Message&& msg) noexcept {
        if (dispatch_ring_.push(std::move(msg))) [[likely]] {
            return true;
        }
        RW_TRACE("[RX] Dispatch ring full, applying backpressure");
        return lcr::adaptive_backoff_until(
            [&] { return dispatch_ring_.push(std::move(msg)); },
            [&] { return !is_active_(); }
        );
    }

    // ---------------------------------------------------------------------
    // Dispatch loop
    // ---------------------------------------------------------------------
    inline void dispatch_loop_() noexcept {
        RW_DEBUG("[DISPATCH] Dispatch loop started");
        chunk::Message msg;
        while (true) {
            const bool got = lcr::adaptive_backoff_until(
                [&] { return dispatch_ring_.pop(msg); },
                [&] { return rx_done_.load(std::memory_order_acquire); }
            );
            // Receive loop gone: deliver whatever it left behind, then stop
            if (!got && !dispatch_ring_.pop(msg)) {
                break;
            }
            dispatch_(std::move(msg));
            maybe_acknowledge_();
        }
        // The fatal error is recorded by whichever thread won the shutdown
        while (!shutdown_published_.load(std::memory_order_acquire)) {
            std::this_thread::yield();
        }
        const Error err = last_error();
        RW_DEBUG("[DISPATCH] Dispatch loop stopped (" << to_string(err) << ")");
        handler_.on_disconnect(err);
    }

    inline void dispatch_(chunk::Message&& msg) noexcept {
        RW_TL1( telemetry_.messages_dispatched_total.inc() );
        switch (msg.chunk_stream_id) {
            case protocol::chunk_stream::Protocol: {
                std::optional<chunk::Message> reply;
                control_.handle(msg, reply);
                if (reply) {
                    (void)enqueue_(std::move(*reply));
                }
                break;
            }

            case protocol::chunk_stream::Command:
                RW_TL1( telemetry_.command_messages_total.inc() );
                if (transition_(Event::CommandReceived)) {
                    RW_INFO("[CONN] Connection established");
                    RW_TL1( telemetry_.established_total.inc() );
                    handler_.on_connect();
                }
                if constexpr (CommandObserver<Handler>) {
                    handler_.on_command(msg);
                }
                break;

            default:
                RW_TL1( telemetry_.messages_delivered_total.inc() );
                handler_.on_receive(std::move(msg));
                break;
        }
    }

    // One acknowledgement per peer window of received bytes
    inline void maybe_acknowledge_() noexcept {
        const std::uint32_t window = params_.in_window_size.load(std::memory_order_relaxed);
        if (window == 0) {
            return;
        }
        const std::uint64_t received = bytes_in_.load(std::memory_order_relaxed);
        if (received - last_ack_bytes_ < window) {
            return;
        }
        last_ack_bytes_ = received;
        RW_TRACE("[DISPATCH] Acknowledging " << received << " bytes");
        if (enqueue_(protocol::make_acknowledgement(static_cast<std::uint32_t>(received)))) {
            RW_TL1( telemetry_.acks_sent_total.inc() );
        }
    }

    // ---------------------------------------------------------------------
    // Send loop
    // ---------------------------------------------------------------------
    inline void send_loop_() noexcept {
        RW_DEBUG("[TX] Send loop started");
        transport::CountingStream<Stream> out{stream_, bytes_out_};
        chunk::Message msg;
        while (outbound_.pop(msg)) {
            if (!is_active_()) {
                break;
            }
            const std::uint32_t chunk_size = params_.out_chunk_size.load(std::memory_order_acquire);
            std::uint32_t chunks = 0;
            const Error err = fragmenter_.write_message(out, msg, chunk_size, &chunks);
            RW_TL1( telemetry_.chunks_tx_total.inc(chunks) );
            if (err == Error::TransportFailure) [[unlikely]] {
                if (is_active_()) {
                    RW_ERROR("[TX] Send failed: " << to_string(err));
                    RW_TL1( telemetry_.send_errors_total.inc() );
                    (void)transition_(Event::TransportFailed, err);
                }
                break;
            }
            if (err != Error::None) [[unlikely]] {
                RW_ERROR("[TX] Dropping invalid message: " << to_string(err));
                RW_TL1( telemetry_.messages_invalid_total.inc() );
                continue;
            }
            RW_TL1( telemetry_.messages_tx_total.inc() );
            apply_sent_control_(msg);
        }
        RW_DEBUG("[TX] Send loop stopped");
    }

    // Our own control messages take effect once they are on the wire
    inline void apply_sent_control_(const chunk::Message& msg) noexcept {
        if (msg.chunk_stream_id != protocol::chunk_stream::Protocol) {
            return;
        }
        std::uint32_t value = 0;
        if (msg.type == protocol::MessageType::ChunkSize && protocol::parse_chunk_size(msg, value)) {
            const auto previous = params_.out_chunk_size.exchange(value, std::memory_order_acq_rel);
            RW_DEBUG("[TX] Outbound chunk size " << previous << " -> " << value);
        }
        else if (msg.type == protocol::MessageType::AckSize && protocol::parse_u32(msg, value)) {
            params_.out_window_size.store(value, std::memory_order_relaxed);
        }
    }

    // ---------------------------------------------------------------------
    // Helpers
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline bool enqueue_(chunk::Message&& msg) noexcept {
        return outbound_.push(std::move(msg));
    }

    [[nodiscard]]
    inline bool is_active_() const noexcept {
        const State s = state();
        return s == State::Running || s == State::Established;
    }

    inline void join_loops_() noexcept {
        std::lock_guard<std::mutex> lock(join_mtx_);
        const auto self = std::this_thread::get_id();
        for (std::thread* t : {&recv_thread_, &send_thread_, &dispatch_thread_}) {
            if (t->joinable() && t->get_id() != self) {
                t->join();
            }
        }
    }

    // ---------------------------------------------------------------------
    // State machine
    // ---------------------------------------------------------------------
    [[nodiscard]]
    static inline constexpr State next_state_(State s, Event ev) noexcept {
        switch (s) {
            case State::Idle:
                if (ev == Event::StartRequested) return State::Running;
                if (ev == Event::CloseRequested) return State::Disconnected;
                return s;

            case State::Running:
                if (ev == Event::CommandReceived) return State::Established;
                [[fallthrough]];

            case State::Established:
                if (ev == Event::CloseRequested ||
                    ev == Event::TransportFailed ||
                    ev == Event::FramingFault) return State::Disconnected;
                return s;

            case State::Disconnected:
            default:
                return s;
        }
    }

    [[nodiscard]]
    static inline constexpr DisconnectReason reason_for_(Event ev) noexcept {
        switch (ev) {
            case Event::CloseRequested:  return DisconnectReason::LocalClose;
            case Event::FramingFault:    return DisconnectReason::FramingError;
            case Event::TransportFailed: return DisconnectReason::TransportError;
            default:                     return DisconnectReason::None;
        }
    }

    // Returns true if this call performed the transition
    inline bool transition_(Event ev, Error err = Error::None) noexcept {
        State current = state_.load(std::memory_order_acquire);
        State next = current;
        do {
            next = next_state_(current, ev);
            if (next == current) {
                RW_TRACE("[CONN] " << to_string(ev) << " ignored in state " << to_string(current));
                return false;
            }
        } while (!state_.compare_exchange_weak(current, next, std::memory_order_acq_rel, std::memory_order_acquire));

        RW_DEBUG("[CONN] " << to_string(current) << " --" << to_string(ev) << "--> " << to_string(next));
        if (next == State::Disconnected) {
            enter_disconnected_(ev, err);
        }
        return true;
    }

    inline void enter_disconnected_(Event ev, Error err) noexcept {
        last_error_.store(err, std::memory_order_release);
        reason_.store(reason_for_(ev), std::memory_order_release);
        RW_TL1( telemetry_.disconnect_events_total.inc() );
        // Unblock the receive loop (read) and the send loop / producers (queue)
        stream_.close();
        outbound_.close();
        shutdown_published_.store(true, std::memory_order_release);
        RW_INFO("[CONN] Disconnected (" << to_string(reason_for_(ev)) << ", " << to_string(err) << ")");
    }

private:
    Stream& stream_;
    Handler& handler_;
    [[maybe_unused]] transport::telemetry::Connection& telemetry_;

    protocol::Parameters params_;
    protocol::ControlHandler control_;

    // Receive loop only
    chunk::Reassembler reassembler_;
    // Send loop only
    chunk::Fragmenter fragmenter_;
    // Dispatch loop only
    std::uint64_t last_ack_bytes_{0};

    lcr::lockfree::spsc_ring<chunk::Message, config::DISPATCH_RING_CAPACITY> dispatch_ring_;
    lcr::sync::bounded_queue<chunk::Message> outbound_;

    std::atomic<State> state_{State::Idle};
    std::atomic<Error> last_error_{Error::None};
    std::atomic<DisconnectReason> reason_{DisconnectReason::None};
    std::atomic<bool> shutdown_published_{false};
    std::atomic<bool> rx_done_{false};

    std::atomic<std::uint64_t> bytes_in_{0};
    std::atomic<std::uint64_t> bytes_out_{0};

    std::thread recv_thread_;
    std::thread dispatch_thread_;
    std::thread send_thread_;
    std::mutex join_mtx_;

#ifdef RW_UNIT_TEST
public:
    // Test-only: messages waiting for the send loop
    [[nodiscard]]
    std::size_t test_outbound_queued() const noexcept {
        return outbound_.size();
    }

    // Test-only: negotiated parameters
    [[nodiscard]]
    const protocol::Parameters& test_parameters() const noexcept {
        return params_;
    }
#endif // RW_UNIT_TEST
};

} // namespace rtmpwire::core
