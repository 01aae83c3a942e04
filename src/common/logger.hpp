#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace flatkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger used by every component (server,
// sessions, store, CLI).
// Call once at program start before any logging. Calling it again only
// updates the level of the already-installed logger.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace flatkv
