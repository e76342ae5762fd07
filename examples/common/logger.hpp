#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace rtmpwire::examples {

    // Unknown names fall back to info
    inline void set_log_level(const std::string& log_level) {
        lcr::log::Logger::instance().set_level(std::string_view{log_level});
    }

} // namespace rtmpwire::examples
