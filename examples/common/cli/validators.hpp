#pragma once

#include <exception>
#include <string>

#include <CLI/CLI.hpp>


namespace nbio::examples::cli {

// -------------------------------------------------------------
// Policy name validator
// -------------------------------------------------------------
inline auto policy_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "return" || value == "yield" || value == "yield-write" || value == "spin") {
            return {};
        }
        return "Policy must be one of: return, yield, yield-write, spin";
    },
    "Semantic policy validator"
);


// -------------------------------------------------------------
// Copy buffer size validator
// -------------------------------------------------------------
inline auto buffer_size_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            const auto n = std::stoul(value);
            if (n >= 1 && n <= 64ul * 1024 * 1024) {
                return {};
            }
            return "Buffer size must be between 1 byte and 64 MiB";
        } catch (const std::exception&) {
            return "Buffer size must be a valid integer";
        }
    },
    "Buffer size validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "trace" || value == "debug" || value == "info" ||
            value == "warn" || value == "error" || value == "off") {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, off";
    },
    "Log level validator"
);

} // namespace nbio::examples::cli
