#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>

#include "rtmpwire/core/config/protocol.hpp"
#include "rtmpwire/core/transport/parse_url.hpp"


namespace rtmpwire::examples::cli {

// -------------------------------------------------------------
// RTMP URL validator
// -------------------------------------------------------------
inline auto rtmp_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::transport::ParsedUrl parsed;
        if (core::transport::parse_url(value, parsed) == core::transport::Error::None) {
            return {};
        }
        return "URL must look like rtmp://host[:port]/app";
    },
    "RTMP URL validator"
);

// -------------------------------------------------------------
// Chunk size validator
// -------------------------------------------------------------
inline auto chunk_size_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            const unsigned long size = std::stoul(value);
            if (size >= 1 && size <= core::config::MAX_CHUNK_SIZE) {
                return {};
            }
        } catch (const std::exception&) {
            // reported below
        }
        return "Chunk size must be between 1 and " + std::to_string(core::config::MAX_CHUNK_SIZE);
    },
    "Chunk size validator"
);

} // namespace rtmpwire::examples::cli
