/*
===============================================================================
 transport::handshake — Group K Unit Tests
===============================================================================

Scope:
------
Client side of the plain handshake against a scripted server.

Covered Requirements:
---------------------
K1. C0+C1 layout, C2 echoes S1, S2 mismatch tolerated
K2. Unsupported server version -> HandshakeFailed, no C2 sent
K3. Server closes early -> HandshakeFailed
K4. Transport failures reported as TransportFailure

===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <vector>

#include "rtmpwire/core/transport/handshake.hpp"
#include "common/memory_stream.hpp"
#include "common/test_check.hpp"

using namespace rtmpwire::core;
using namespace rtmpwire::core::transport;
using rtmpwire::test::MemoryStream;
using Bytes = std::vector<std::uint8_t>;

constexpr std::size_t N = config::HANDSHAKE_PACKET_SIZE;


// S0 + S1 + S2 as a server would send them
static Bytes server_reply(std::uint8_t version) {
    Bytes b;
    b.push_back(version);
    for (std::size_t i = 0; i < N; ++i) {
        b.push_back(static_cast<std::uint8_t>(i * 13 + 1));
    }
    for (std::size_t i = 0; i < N; ++i) {
        b.push_back(static_cast<std::uint8_t>(i));
    }
    return b;
}


// -----------------------------------------------------------------------------
// Group K1: Successful handshake
// -----------------------------------------------------------------------------
void test_success() {
    std::cout << "[TEST] Group K1: successful handshake\n";

    const Bytes reply = server_reply(3);
    MemoryStream stream{reply, 500};
    TEST_CHECK(handshake(stream) == Error::None);
    TEST_CHECK(stream.remaining_input() == 0);

    const auto& out = stream.output();
    TEST_CHECK(out.size() == 1 + N + N);
    TEST_CHECK(out[0] == 3);
    // C1 bytes 4..7 are zero
    TEST_CHECK(out[5] == 0 && out[6] == 0 && out[7] == 0 && out[8] == 0);
    // C2 echoes S1
    TEST_CHECK(Bytes(out.begin() + 1 + N, out.end()) == Bytes(reply.begin() + 1, reply.begin() + 1 + N));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group K2: Unsupported version
// -----------------------------------------------------------------------------
void test_bad_version() {
    std::cout << "[TEST] Group K2: unsupported server version\n";

    MemoryStream stream{server_reply(6)};
    TEST_CHECK(handshake(stream) == Error::HandshakeFailed);
    TEST_CHECK(stream.output().size() == 1 + N);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group K3: Server closes early
// -----------------------------------------------------------------------------
void test_early_close() {
    std::cout << "[TEST] Group K3: server closes early\n";

    {
        Bytes reply = server_reply(3);
        reply.resize(100);
        MemoryStream stream{reply};
        TEST_CHECK(handshake(stream) == Error::HandshakeFailed);
        TEST_CHECK(stream.output().size() == 1 + N);
    }
    {
        Bytes reply = server_reply(3);
        reply.resize(1 + N + 10);
        MemoryStream stream{reply};
        TEST_CHECK(handshake(stream) == Error::HandshakeFailed);
        TEST_CHECK(stream.output().size() == 1 + N + N);
    }
    {
        MemoryStream stream{Bytes{}};
        TEST_CHECK(handshake(stream) == Error::HandshakeFailed);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group K4: Transport failures
// -----------------------------------------------------------------------------
void test_transport_failure() {
    std::cout << "[TEST] Group K4: transport failures\n";

    {
        MemoryStream stream{server_reply(3)};
        stream.set_write_budget(0);
        TEST_CHECK(handshake(stream) == Error::TransportFailure);
        TEST_CHECK(stream.read_calls() == 0);
    }
    {
        MemoryStream stream{server_reply(3)};
        stream.set_fail_reads(true);
        TEST_CHECK(handshake(stream) == Error::TransportFailure);
    }
    {
        // C2 cannot be written
        MemoryStream stream{server_reply(3)};
        stream.set_write_budget(1 + N);
        TEST_CHECK(handshake(stream) == Error::TransportFailure);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Fatal);

    test_success();
    test_bad_version();
    test_early_close();
    test_transport_failure();

    std::cout << "\n[GROUP K — HANDSHAKE TESTS PASSED]\n";
    return 0;
}
