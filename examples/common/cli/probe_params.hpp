#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace rtmpwire::examples::cli::probe {

    // -------------------------------------------------------------
    // Probe parameters
    // -------------------------------------------------------------
    struct Params {
        std::string url          = "rtmp://127.0.0.1/live";
        std::uint32_t chunk_size = 4096;
        std::string payload;                 // file sent as the first command
        std::uint32_t duration   = 10;       // seconds, 0 = until Ctrl+C
        std::string log_level    = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  URL        : " << url << "\n"
               << "  Chunk size : " << chunk_size << "\n"
               << "  Payload    : " << (payload.empty() ? "(none)" : payload) << "\n"
               << "  Duration   : " << duration << "s\n"
               << "  Log Level  : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("--url", params.url, "RTMP server URL")->check(rtmp_url_validator)->default_val(params.url);
        app.add_option("-c,--chunk-size", params.chunk_size, "Outbound chunk size to negotiate")->check(chunk_size_validator)->default_val(params.chunk_size);
        app.add_option("-p,--payload", params.payload, "File sent on the command stream after the handshake")->check(CLI::ExistingFile);
        app.add_option("-d,--duration", params.duration, "Seconds to stay connected (0 = until Ctrl+C)")->default_val(params.duration);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);
        app.footer(
            "Connects, performs the handshake and runs the chunk pipeline.\n"
            "Press Ctrl+C to close the connection and print telemetry."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        set_log_level(params.log_level);
        return params;
    }

} // namespace rtmpwire::examples::cli::probe
