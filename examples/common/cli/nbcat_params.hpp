#pragma once

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "nbio/config/copy.hpp"

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace nbio::examples::cli::nbcat {

    // -------------------------------------------------------------
    // nbcat parameters
    // -------------------------------------------------------------
    struct Params {
        std::string input       = "-";
        std::string output      = "-";
        std::string policy      = "yield-write";
        std::size_t buffer      = nbio::config::copy::DEFAULT_BUFFER_SIZE;
        bool backoff            = false;
        bool digest             = false;
        std::string log_level   = "warn";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Input     : " << input << "\n"
               << "  Output    : " << output << "\n"
               << "  Policy    : " << policy << "\n"
               << "  Buffer    : " << buffer << " bytes\n"
               << "  Backoff   : " << (backoff ? "true" : "false") << "\n"
               << "  Digest    : " << (digest ? "true" : "false") << "\n"
               << "  Log Level : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("input", params.input, "Input file ('-' for stdin)")->default_val(params.input);
        app.add_option("output", params.output, "Output file ('-' for stdout)")->default_val(params.output);
        app.add_option("-p,--policy", params.policy, "Semantic policy: return | yield | yield-write | spin")->check(policy_validator)->default_val(params.policy);
        app.add_option("-b,--buffer", params.buffer, "Copy buffer size in bytes")->check(buffer_size_validator)->default_val(params.buffer);
        app.add_flag("--backoff", params.backoff, "Wait with adaptive backoff instead of poll() on WouldBlock");
        app.add_flag("--digest", params.digest, "Print the XXH64 digest of the copied bytes to stderr");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | off")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Copies input to output through non-blocking descriptors.\n"
            "WouldBlock is handled by the selected policy, then by waiting for readiness."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level);
        return params;
    }

} // namespace nbio::examples::cli::nbcat
