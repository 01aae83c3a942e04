#include "storage/store.hpp"
#include "persistence/flat_file.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace flatkv {

Store::Store(std::filesystem::path path) : path_(std::move(path)) {
    // Failures are already logged by load(); startup continues regardless.
    if (auto ec = load()) {
        spdlog::warn("Store: continuing with {} entries after load error: {}",
                     size(), ec.message());
    }
}

std::string Store::not_found(std::string_view key) {
    return fmt::format("Key '{}' not found.", key);
}

std::string Store::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    spdlog::debug("Store: set '{}' = '{}'", key, value);
    map_.insert_or_assign(key, value);
    if (save()) {
        spdlog::warn("Store: SET '{}' acknowledged but not persisted", key);
    }
    return fmt::format("Added key '{}' with value '{}'\n", key, value);
}

std::string Store::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
        return not_found(key);
    }
    return it->second;
}

std::string Store::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    if (map_.erase(key) == 0) {
        return not_found(key);
    }
    spdlog::debug("Store: removed '{}'", key);
    if (save()) {
        spdlog::warn("Store: REMOVE '{}' acknowledged but not persisted", key);
    }
    return fmt::format("Removed key '{}'.\n", key);
}

std::string Store::print() const {
    std::lock_guard lock(mutex_);
    if (map_.empty()) {
        return "Store is empty.\n";
    }
    std::string out;
    for (const auto& [key, value] : map_) {
        out += fmt::format("[KEY]: {}\t[VALUE]: {}\n", key, value);
    }
    return out;
}

std::error_code Store::load() {
    std::lock_guard lock(mutex_);
    if (!persistence::FlatFile::exists(path_)) {
        spdlog::debug("Store: no data file at {}, starting empty", path_.string());
        return {};
    }

    persistence::FlatFileLoadResult result;
    const auto ec = persistence::FlatFile::load(path_, result);

    // Keep whatever was decoded, even after a read error.
    for (auto& [key, value] : result.entries) {
        map_.insert_or_assign(key, std::move(value));
    }

    if (!ec) {
        spdlog::info("Store: loaded {} entries from {}", result.entries.size(),
                     path_.string());
    }
    return ec;
}

std::error_code Store::save() {
    std::lock_guard lock(mutex_);
    auto ec = persistence::FlatFile::save(path_, map_);
    if (ec) {
        spdlog::error("Store: failed to persist {} entries to {}: {}",
                      map_.size(), path_.string(), ec.message());
    }
    return ec;
}

std::size_t Store::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

std::map<std::string, std::string> Store::snapshot() const {
    std::lock_guard lock(mutex_);
    return map_;
}

} // namespace flatkv
