/*
===============================================================================
 core::Connection — Group B Unit Tests
===============================================================================

Scope:
------
Inbound routing by chunk stream and the protocol control the pipeline
answers on its own.

Covered Requirements:
---------------------
B1. Routing
    - command stream establishes the connection, on_connect() exactly once
    - command messages go to on_command(), never to on_receive()
    - every other chunk stream goes to on_receive() in arrival order

B2. Peer chunk size
    - applies to the very next chunk read
    - control messages are not delivered to the application

B3. Ping request answered with a ping response

B4. Acknowledgements
    - one acknowledgement per peer window of received bytes

B5. Peer bandwidth and peer acknowledgement recorded

===============================================================================
*/

#include <iostream>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// Group B1: Routing
// -----------------------------------------------------------------------------
void test_routing() {
    std::cout << "[TEST] Group B1: routing by chunk stream\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    // Media before the command stream answers is still delivered
    stream.feed(peer_message(media(300, 1, 10)));
    TEST_CHECK(handler.wait_for_messages(1));
    TEST_CHECK(!connection.is_established());

    stream.feed(peer_message(command(1)));
    TEST_CHECK(handler.wait_for_connect());
    TEST_CHECK(connection.is_established());
    TEST_CHECK(connection.state() == State::Established);

    stream.feed(peer_message(command(2)));
    Message audio = chunk::make_message(4, MessageType::Audio, 1, 20, payload_of(64, 2));
    stream.feed(peer_message(audio));
    stream.feed(peer_message(media(129, 3, 30)));
    TEST_CHECK(handler.wait_for_messages(3));

    const auto received = handler.received();
    TEST_CHECK(received.size() == 3);
    TEST_CHECK(received[0].chunk_stream_id == 6);
    TEST_CHECK(received[0].buffer == payload_of(300, 1));
    TEST_CHECK(received[0].absolute_timestamp == 10);
    TEST_CHECK(received[1].chunk_stream_id == 4);
    TEST_CHECK(received[1].type == MessageType::Audio);
    TEST_CHECK(received[1].buffer == payload_of(64, 2));
    TEST_CHECK(received[2].buffer == payload_of(129, 3));

    connection.close();
    TEST_CHECK(handler.connects() == 1);
    TEST_CHECK(handler.commands().size() == 2);
    TEST_CHECK(handler.commands()[1].buffer == payload_of(20, 2));
    TEST_CHECK(handler.order_ok());
    TEST_CHECK(telemetry.established_total.load() == 1);
    TEST_CHECK(telemetry.command_messages_total.load() == 2);
    TEST_CHECK(telemetry.messages_delivered_total.load() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B2: Peer chunk size
// -----------------------------------------------------------------------------
void test_peer_chunk_size() {
    std::cout << "[TEST] Group B2: peer chunk size change\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    // Both arrive together: the media chunk must be read at the new size
    Bytes wire = peer_message(protocol::make_set_chunk_size(4096));
    append(wire, peer_message(media(3000, 7), 4096));
    append(wire, peer_message(media(5000, 8), 4096));
    stream.feed(wire);

    TEST_CHECK(handler.wait_for_messages(2));
    TEST_CHECK(connection.in_chunk_size() == 4096);
    TEST_CHECK(connection.out_chunk_size() == config::DEFAULT_CHUNK_SIZE);
    const auto received = handler.received();
    TEST_CHECK(received.size() == 2);
    TEST_CHECK(received[0].buffer == payload_of(3000, 7));
    TEST_CHECK(received[1].buffer == payload_of(5000, 8));

    connection.close();
    TEST_CHECK(handler.last_error() == Error::LocalShutdown);
    TEST_CHECK(telemetry.framing_errors_total.load() == 0);
    TEST_CHECK(telemetry.chunks_rx_total.load() == 1 + 1 + 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B3: Ping
// -----------------------------------------------------------------------------
void test_ping_response() {
    std::cout << "[TEST] Group B3: ping request answered\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    stream.feed(peer_message(protocol::make_user_control(protocol::UserControlEvent::PingRequest, 0x01020304)));
    TEST_CHECK(stream.wait_for_output(12 + 6, 2s));

    const auto pings = of_type(decode_output(stream.output()), MessageType::Ping);
    TEST_CHECK(pings.size() == 1);
    TEST_CHECK(pings[0].chunk_stream_id == protocol::chunk_stream::Protocol);
    TEST_CHECK(pings[0].stream_id == 0);
    TEST_CHECK(pings[0].buffer == Bytes({0x00, 0x07, 0x01, 0x02, 0x03, 0x04}));

    connection.close();
    TEST_CHECK(handler.received().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B4: Acknowledgements
// -----------------------------------------------------------------------------
void test_acknowledgements() {
    std::cout << "[TEST] Group B4: acknowledgement per window\n";

    constexpr std::uint32_t window = 1000;

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    stream.feed(peer_message(protocol::make_window_ack_size(window)));
    TEST_CHECK(wait_until([&] { return connection.in_window_size() == window; }));

    constexpr int count = 20;
    for (int i = 0; i < count; ++i) {
        stream.feed(peer_message(media(300, static_cast<std::uint8_t>(i))));
    }
    TEST_CHECK(handler.wait_for_messages(count));
    const std::uint64_t total = 16 + count * (12 + 300 + 2);

    // Dispatch is sequential: once a later message is handled, every
    // acknowledgement for the media bytes has been queued
    stream.feed(peer_message(protocol::make_acknowledgement(777)));
    TEST_CHECK(wait_until([&] { return connection.peer_acknowledged() == 777; }));
    const auto queued = telemetry.acks_sent_total.load();
    TEST_CHECK(wait_until([&] { return telemetry.messages_tx_total.load() >= queued; }));
    TEST_CHECK(connection.bytes_in() == total + 16);

    connection.close();

    const auto acks = of_type(decode_output(stream.output()), MessageType::Ack);
    TEST_CHECK(!acks.empty());
    TEST_CHECK(acks.size() >= queued);
    std::uint32_t previous = 0;
    for (const auto& ack : acks) {
        std::uint32_t seq = 0;
        TEST_CHECK(protocol::parse_u32(ack, seq));
        TEST_CHECK(seq >= previous + window);
        TEST_CHECK(seq <= total + 16);
        previous = seq;
    }
    // Never a full window of media left unacknowledged
    TEST_CHECK(previous + window > total);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B5: Peer bandwidth and acknowledgement
// -----------------------------------------------------------------------------
void test_peer_parameters() {
    std::cout << "[TEST] Group B5: peer bandwidth and acknowledgement\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    Bytes wire = peer_message(protocol::make_set_peer_bandwidth(5'000'000, protocol::BandwidthLimit::Soft));
    append(wire, peer_message(protocol::make_acknowledgement(4321)));
    stream.feed(wire);

    TEST_CHECK(wait_until([&] { return connection.peer_acknowledged() == 4321; }));
    TEST_CHECK(connection.peer_bandwidth() == 5'000'000);
    TEST_CHECK(connection.test_parameters().peer_bandwidth_limit.load() == protocol::BandwidthLimit::Soft);

    connection.close();
    TEST_CHECK(handler.received().empty());
    TEST_CHECK(telemetry.control_handled_total.load() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_routing();
    test_peer_chunk_size();
    test_ping_response();
    test_acknowledgements();
    test_peer_parameters();

    std::cout << "\n[GROUP B — CONNECTION DISPATCH TESTS PASSED]\n";
    return 0;
}
