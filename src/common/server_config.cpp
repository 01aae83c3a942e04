#include "common/server_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/address.hpp>
#include <boost/program_options.hpp>
#include <boost/system/error_code.hpp>

#include <fmt/format.h>

namespace po = boost::program_options;

namespace flatkv {

namespace {

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(cfg.host, ec);
    if (ec) {
        throw std::runtime_error(
            fmt::format("--host must be an IP address, got '{}'", cfg.host));
    }

    if (cfg.data_file.empty()) {
        throw std::runtime_error("--data-file must not be empty");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value(kDefaultHost),
            "Listen address for client connections")
        ("port,p",
            po::value<std::uint16_t>()->default_value(kDefaultPort),
            "Listen port for client connections")
        ("data-file",
            po::value<std::string>()->default_value(kDefaultDataFile),
            "Flat file mirroring the store (key<TAB>value per line)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("flatkv-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host      = vm["host"].as<std::string>();
    cfg.port      = vm["port"].as<std::uint16_t>();
    cfg.data_file = vm["data-file"].as<std::string>();
    cfg.log_level = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace flatkv
