#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>
#include <vector>

#include "rtmpwire/core/connection.hpp"
#include "rtmpwire/core/chunk/message.hpp"
#include "rtmpwire/core/protocol/chunk_stream_id.hpp"
#include "rtmpwire/core/transport/handshake.hpp"
#include "rtmpwire/core/transport/parse_url.hpp"
#include "rtmpwire/core/transport/tcp/socket_stream.hpp"
#include "rtmpwire/core/transport/telemetry/connection.hpp"
#include "common/cli/probe_params.hpp"

using namespace rtmpwire::core;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}


// -----------------------------------------------------------------------------
// Prints what the server sends
// -----------------------------------------------------------------------------
struct ProbeHandler {
    std::atomic<std::uint64_t> media_messages{0};
    std::atomic<std::uint64_t> media_bytes{0};

    void on_connect() {
        std::cout << "[probe] Server answered on the command stream\n";
    }

    void on_disconnect(transport::Error err) {
        std::cout << "[probe] Disconnected: " << transport::to_string(err) << "\n";
        running.store(false);
    }

    void on_receive(chunk::Message&& msg) {
        media_messages.fetch_add(1, std::memory_order_relaxed);
        media_bytes.fetch_add(msg.length, std::memory_order_relaxed);
        std::cout << "[probe] " << protocol::to_string(msg.type) << " csid=" << msg.chunk_stream_id
                  << " stream=" << msg.stream_id << " ts=" << msg.absolute_timestamp
                  << " len=" << msg.length << "\n";
    }

    void on_command(const chunk::Message& msg) {
        std::cout << "[probe] Command message (" << msg.length << " bytes)\n";
    }
};


static bool load_file(const std::string& path, std::vector<std::uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}


int main(int argc, char** argv) {
    const auto params = rtmpwire::examples::cli::probe::configure(argc, argv, "rtmpwire probe");
    params.dump("=== rtmpwire probe ===", std::cout);

    std::signal(SIGINT, on_signal);  // Handle Ctrl+C

    transport::ParsedUrl url;
    if (transport::parse_url(params.url, url) != transport::Error::None) {
        std::cerr << "Invalid URL: " << params.url << "\n";
        return 1;
    }
    if (url.secure) {
        std::cerr << "rtmps:// needs a TLS byte stream, which this probe does not provide\n";
        return 1;
    }

    std::vector<std::uint8_t> payload;
    if (!params.payload.empty() && !load_file(params.payload, payload)) {
        std::cerr << "Cannot read payload file " << params.payload << "\n";
        return 1;
    }

    transport::tcp::SocketStream stream;
    auto err = stream.connect(url.host, url.port);
    if (err != transport::Error::None) {
        std::cerr << "Connect to " << url.host << ":" << url.port << " failed: " << transport::to_string(err) << "\n";
        return 2;
    }
    err = transport::handshake(stream);
    if (err != transport::Error::None) {
        std::cerr << "Handshake failed: " << transport::to_string(err) << "\n";
        return 3;
    }

    transport::telemetry::Connection telemetry;
    ProbeHandler handler;
    {
        Connection<transport::tcp::SocketStream, ProbeHandler> connection{stream, handler, telemetry};
        if (connection.start() != transport::Error::None) {
            return 4;
        }
        if (!connection.set_chunk_size(params.chunk_size)) {
            std::cerr << "Could not queue the chunk size message\n";
        }
        if (!payload.empty()) {
            const auto size = payload.size();
            auto msg = chunk::make_message(protocol::chunk_stream::Command, protocol::MessageType::Amf0, 0, 0, std::move(payload));
            if (!connection.send(std::move(msg))) {
                std::cerr << "Payload of " << size << " bytes rejected\n";
            }
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.duration);
        while (running.load(std::memory_order_relaxed)) {
            if (params.duration > 0 && std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        connection.close();
        std::cout << "[probe] " << handler.media_messages.load() << " messages, " << handler.media_bytes.load()
                  << " payload bytes; " << connection.bytes_in() << " bytes in, " << connection.bytes_out() << " bytes out\n";
    }

    telemetry.debug_dump(std::cout);
    return 0;
}
