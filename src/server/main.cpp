#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "storage/store.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <memory>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    flatkv::ServerConfig cfg;
    try {
        cfg = flatkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    flatkv::init_default_logger(flatkv::parse_log_level(cfg.log_level));

    spdlog::info("flatkv-server starting – listen={}:{} data_file={}",
                 cfg.host, cfg.port, cfg.data_file);

    // ── Storage ──────────────────────────────────────────────────────────────
    // Load problems are logged by the Store and never abort startup.
    auto store = std::make_shared<flatkv::Store>(cfg.data_file);
    spdlog::info("Store ready with {} entries", store->size());

    // ── Listener ─────────────────────────────────────────────────────────────
    std::unique_ptr<flatkv::network::Server> server;
    try {
        server = std::make_unique<flatkv::network::Server>(cfg, store);
    } catch (const boost::system::system_error& e) {
        spdlog::critical("Failed to set up server on {}:{}: {}",
                         cfg.host, cfg.port, e.what());
        return 1;
    }

    server->run();

    spdlog::info("flatkv-server stopped");
    return 0;
}
