#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace flatkv {

// ── Defaults ──────────────────────────────────────────────────────────────────

inline constexpr const char*   kDefaultHost     = "0.0.0.0";
inline constexpr std::uint16_t kDefaultPort     = 3490;
inline constexpr const char*   kDefaultDataFile = "store.txt";

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one flatkv-server process.
// Default-constructed values match the CLI defaults, so tests and embedders
// can build a config directly without going through parse_config().

struct ServerConfig {
    std::string   host      = kDefaultHost;     // Listen address
    std::uint16_t port      = kDefaultPort;     // Listen port (0 = ephemeral)
    std::string   data_file = kDefaultDataFile; // Persistence file path
    std::string   log_level = "info";           // spdlog level string
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help is reported the same way, carrying the usage text.
//
// Validates:
//   - --host is a valid IPv4/IPv6 address
//   - --data-file is not empty

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with flatkv-server
// options. Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace flatkv
