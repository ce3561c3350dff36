#pragma once

#include <string>

#include "nbio/log/logger.hpp"


namespace nbio::examples {

    inline void set_log_level(const std::string& log_level) {
        using namespace nbio::log;
        if (log_level == "trace")      Logger::instance().set_level(Level::Trace);
        else if (log_level == "debug") Logger::instance().set_level(Level::Debug);
        else if (log_level == "info")  Logger::instance().set_level(Level::Info);
        else if (log_level == "error") Logger::instance().set_level(Level::Error);
        else if (log_level == "off")   Logger::instance().set_level(Level::Off);
        else                           Logger::instance().set_level(Level::Warn);
    }

} // namespace nbio::examples
