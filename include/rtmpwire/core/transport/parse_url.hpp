#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "rtmpwire/core/transport/error.hpp"


namespace rtmpwire::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure = false;  // true = rtmps, false = rtmp
        std::string host;
        std::string port;
        std::string path;     // always starts with '/'
        std::string app;      // first path segment (may be empty)
    };

    inline constexpr std::string_view DEFAULT_PORT        = "1935";
    inline constexpr std::string_view DEFAULT_SECURE_PORT = "443";


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting rtmp:// and rtmps://
    // Accepts the URLs media servers publish and rejects malformed inputs
    // without attempting full RFC compliance.
    //
    // Example inputs:
    //   rtmp://live.example.com/app/stream
    //   rtmps://live.example.com:4443/app
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(const std::string& url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view rtmp  = "rtmp://";
        constexpr std::string_view rtmps = "rtmps://";
        size_t pos = 0;
        if (url.compare(0, rtmp.size(), rtmp) == 0) {
            out.secure = false;
            pos = rtmp.size();
        }
        else if (url.compare(0, rtmps.size(), rtmps) == 0) {
            out.secure = true;
            pos = rtmps.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port]
        size_t slash = url.find('/', pos);
        std::string hostport = (slash == std::string::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        size_t colon = hostport.rfind(':');
        if (colon != std::string::npos) {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
        } else {
            out.host = hostport;
            out.port = std::string(out.secure ? DEFAULT_SECURE_PORT : DEFAULT_PORT);
        }
        // 4) Path (default "/" if missing) and application name
        out.path = (slash == std::string::npos) ? "/" : url.substr(slash);
        const size_t app_end = out.path.find('/', 1);
        out.app = (app_end == std::string::npos) ? out.path.substr(1) : out.path.substr(1, app_end - 1);

        // Invariants check --------------------------------

        // Validate host
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        // Validate port - must be numeric and in range
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace rtmpwire::core::transport
