/*
===============================================================================
 core::Connection — Group C Unit Tests
===============================================================================

Scope:
------
Caller-facing semantics of send() and outbound parameter renegotiation.

Covered Requirements:
---------------------
C1. send() rejects invalid messages and non-running pipelines

C2. send() writes messages in order, chunked at the outbound chunk size

C3. Backpressure
    - a stalled writer fills the outbound queue (100 messages)
    - the next send() blocks instead of dropping
    - releasing the writer delivers everything, in order

C4. set_chunk_size()
    - messages queued after the call are chunked with the new size
    - out_chunk_size() changes once the control message is written
    - invalid sizes rejected

C5. set_window_ack_size() recorded once written

===============================================================================
*/

#include <atomic>
#include <iostream>
#include <thread>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// Group C1: Rejected sends
// -----------------------------------------------------------------------------
void test_rejected_sends() {
    std::cout << "[TEST] Group C1: rejected sends\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};

    // Not started yet
    TEST_CHECK(!connection.send(media(10)));

    TEST_CHECK(connection.start() == Error::None);

    Message bad_csid = media(10);
    bad_csid.chunk_stream_id = 1;
    TEST_CHECK(!connection.send(bad_csid));

    Message mismatch = media(10);
    mismatch.length = 20;
    TEST_CHECK(!connection.send(mismatch));

    Message too_large = media(10);
    too_large.length = config::MAX_MESSAGE_LENGTH + 1;
    TEST_CHECK(!connection.send(too_large));

    TEST_CHECK(connection.send(media(10)));
    TEST_CHECK(stream.wait_for_output(22, 2s));

    connection.close();
    TEST_CHECK(!connection.send(media(10)));
    TEST_CHECK(stream.output().size() == 22);
    TEST_CHECK(telemetry.send_calls_total.load() == 6);
    TEST_CHECK(telemetry.send_rejected_total.load() == 5);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C2: Ordered, chunked output
// -----------------------------------------------------------------------------
void test_ordered_output() {
    std::cout << "[TEST] Group C2: ordered chunked output\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    const std::uint32_t sizes[] = {0, 1, 127, 128, 129, 256, 1000};
    std::size_t expected_bytes = 0;
    std::uint8_t seed = 0;
    for (std::uint32_t size : sizes) {
        TEST_CHECK(connection.send(media(size, seed++, size)));
        const std::size_t chunks = (size == 0) ? 1 : (size + 127) / 128;
        expected_bytes += 12 + size + (chunks - 1);
    }
    TEST_CHECK(stream.wait_for_output(expected_bytes, 2s));
    connection.close();

    TEST_CHECK(stream.output().size() == expected_bytes);
    TEST_CHECK(connection.bytes_out() == expected_bytes);

    const auto out = decode_output(stream.output());
    TEST_CHECK(out.messages.size() == std::size(sizes));
    seed = 0;
    for (std::size_t i = 0; i < out.messages.size(); ++i) {
        const auto& m = out.messages[i];
        TEST_CHECK(m.length == sizes[i]);
        TEST_CHECK(m.buffer == payload_of(sizes[i], seed++));
        TEST_CHECK(m.absolute_timestamp == sizes[i]);
        TEST_CHECK(m.stream_id == 1);
        TEST_CHECK(out.chunk_counts[i] == ((sizes[i] == 0) ? 1 : (sizes[i] + 127) / 128));
    }
    TEST_CHECK(telemetry.messages_tx_total.load() == std::size(sizes));
    TEST_CHECK(telemetry.chunks_tx_total.load() == 1 + 1 + 1 + 1 + 2 + 2 + 8);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C3: Backpressure
// -----------------------------------------------------------------------------
void test_backpressure() {
    std::cout << "[TEST] Group C3: backpressure without loss\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    stream.hold_writes();

    // First message parks the send loop inside write()
    TEST_CHECK(connection.send(media(10, 0)));
    TEST_CHECK(stream.wait_for_blocked_writer(2s));

    // Fill the outbound queue
    const std::size_t capacity = config::OUTBOUND_QUEUE_CAPACITY;
    for (std::size_t i = 1; i <= capacity; ++i) {
        TEST_CHECK(connection.send(media(10, static_cast<std::uint8_t>(i))));
    }
    TEST_CHECK(connection.test_outbound_queued() == capacity);

    // One more blocks
    std::atomic<bool> done{false};
    std::atomic<bool> accepted{false};
    std::thread producer([&] {
        accepted.store(connection.send(media(10, static_cast<std::uint8_t>(capacity + 1))));
        done.store(true);
    });
    std::this_thread::sleep_for(50ms);
    TEST_CHECK(!done.load());
    TEST_CHECK(connection.test_outbound_queued() == capacity);

    stream.release_writes();
    producer.join();
    TEST_CHECK(accepted.load());

    const std::size_t total = capacity + 2;
    TEST_CHECK(stream.wait_for_output(total * 22, 5s));
    connection.close();

    const auto out = decode_output(stream.output());
    TEST_CHECK(out.messages.size() == total);
    for (std::size_t i = 0; i < total; ++i) {
        TEST_CHECK(out.messages[i].buffer == payload_of(10, static_cast<std::uint8_t>(i)));
    }
    TEST_CHECK(telemetry.send_rejected_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C4: set_chunk_size()
// -----------------------------------------------------------------------------
void test_set_chunk_size() {
    std::cout << "[TEST] Group C4: outbound chunk size renegotiation\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    TEST_CHECK(!connection.set_chunk_size(0));
    TEST_CHECK(!connection.set_chunk_size(config::MAX_CHUNK_SIZE + 1));

    TEST_CHECK(connection.send(media(300, 1)));
    TEST_CHECK(connection.set_chunk_size(4096));
    TEST_CHECK(connection.send(media(3000, 2)));
    TEST_CHECK(connection.send(media(5000, 3)));

    const std::size_t expected = (12 + 300 + 2) + (12 + 4) + (12 + 3000) + (12 + 5000 + 1);
    TEST_CHECK(stream.wait_for_output(expected, 2s));
    TEST_CHECK(connection.out_chunk_size() == 4096);
    TEST_CHECK(connection.in_chunk_size() == config::DEFAULT_CHUNK_SIZE);
    connection.close();

    const auto out = decode_output(stream.output());
    TEST_CHECK(out.messages.size() == 4);
    TEST_CHECK(out.messages[0].buffer == payload_of(300, 1));
    TEST_CHECK(out.chunk_counts[0] == 3);
    TEST_CHECK(out.messages[1].type == MessageType::ChunkSize);
    TEST_CHECK(out.messages[1].chunk_stream_id == protocol::chunk_stream::Protocol);
    TEST_CHECK(out.messages[2].buffer == payload_of(3000, 2));
    TEST_CHECK(out.chunk_counts[2] == 1);
    TEST_CHECK(out.messages[3].buffer == payload_of(5000, 3));
    TEST_CHECK(out.chunk_counts[3] == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C5: set_window_ack_size()
// -----------------------------------------------------------------------------
void test_set_window_ack_size() {
    std::cout << "[TEST] Group C5: acknowledgement window announcement\n";

    telemetry::Connection telemetry;
    StreamUnderTest stream;
    HandlerUnderTest handler;
    ConnectionUnderTest connection{stream, handler, telemetry};
    TEST_CHECK(connection.start() == Error::None);

    TEST_CHECK(!connection.set_window_ack_size(0));
    TEST_CHECK(connection.out_window_size() == config::DEFAULT_WINDOW_SIZE);
    TEST_CHECK(connection.set_window_ack_size(1'000'000));
    TEST_CHECK(wait_until([&] { return connection.out_window_size() == 1'000'000; }));
    // Inbound window is the peer's business
    TEST_CHECK(connection.in_window_size() == config::DEFAULT_WINDOW_SIZE);

    connection.close();
    const auto sent = of_type(decode_output(stream.output()), MessageType::AckSize);
    TEST_CHECK(sent.size() == 1);
    TEST_CHECK(sent[0].buffer == Bytes({0x00, 0x0F, 0x42, 0x40}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_rejected_sends();
    test_ordered_output();
    test_backpressure();
    test_set_chunk_size();
    test_set_window_ack_size();

    std::cout << "\n[GROUP C — CONNECTION SEND TESTS PASSED]\n";
    return 0;
}
