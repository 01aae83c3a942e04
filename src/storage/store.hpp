#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

namespace flatkv {

// Thread-safe key-value store mirrored to a flat file.
//
// Concurrency model:
//   - Every public method holds one recursive mutex for its whole duration,
//     including the file rewrite that follows a mutation.  Reads are not
//     parallel: get()/print() wait behind a running save().
//   - The mutex is recursive so that set()/remove() can call save(), which
//     locks again.
//
// Persistence model:
//   - The constructor loads the file if it exists.  A missing file is an
//     empty store; an unreadable file is logged and whatever was decoded
//     before the failure is kept.
//   - set() and remove() rewrite the whole file before returning.  A failed
//     rewrite is logged but the confirmation text is still returned, so the
//     client sees success while the file is stale.
//
// Return values of set/get/remove/print are the exact response texts sent
// to clients.
class Store {
public:
    explicit Store(std::filesystem::path path);

    // Not copyable or movable – sessions hold it through a shared_ptr and
    // the mutex must not change identity.
    Store(const Store&)            = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&)                 = delete;
    Store& operator=(Store&&)      = delete;

    // Inserts or overwrites `key`, then rewrites the file.
    // Returns "Added key '<key>' with value '<value>'\n".
    std::string set(const std::string& key, const std::string& value);

    // Returns the value, or "Key '<key>' not found." (no trailing newline).
    [[nodiscard]] std::string get(const std::string& key) const;

    // Removes `key` and rewrites the file.  Returns "Removed key '<key>'.\n",
    // or the not-found text without touching the file.
    std::string remove(const std::string& key);

    // One "[KEY]: <k>\t[VALUE]: <v>\n" line per entry in key order, or
    // "Store is empty.\n".
    [[nodiscard]] std::string print() const;

    // Merges the file's entries into the mapping.  Missing file → {}.
    std::error_code load();

    // Rewrites the file from the mapping.
    std::error_code save();

    [[nodiscard]] std::size_t size() const;

    // Full copy of the current mapping.
    [[nodiscard]] std::map<std::string, std::string> snapshot() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] static std::string not_found(std::string_view key);

private:
    const std::filesystem::path path_;
    mutable std::recursive_mutex mutex_;
    std::map<std::string, std::string> map_;
};

} // namespace flatkv
