#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace flatkv::persistence {

// ── Flat file load result ────────────────────────────────────────────────────

struct FlatFileLoadResult {
    std::map<std::string, std::string> entries;
    std::size_t skipped_lines = 0; // non-empty lines without a delimiter
};

// ── FlatFile ─────────────────────────────────────────────────────────────────
//
// Text mirror of the whole store.  Format:
//
//   <key>\t<value>\n     × entry count, sorted by key
//
// No header, no version, no checksum, no escaping: a key or value containing
// a TAB or newline corrupts the file.
//
// save() truncates and rewrites the file in place.  A crash in the middle of
// a save can leave a truncated file behind; there is no tmp+rename step.
//
// Thread-safety: static methods, no mutable state.  Caller must serialise
// saves to the same path (Store holds its lock across save()).

class FlatFile {
public:
    static constexpr char kDelimiter = '\t';

    // Rewrite `path` with every entry of `entries`.
    [[nodiscard]] static std::error_code save(
        const std::filesystem::path& path,
        const std::map<std::string, std::string>& entries);

    // Read `path` line by line into `result.entries`.
    // Lines are trimmed; empty lines are ignored; a line without a TAB is
    // counted in `result.skipped_lines` and otherwise ignored.  On a read
    // error the lines decoded before the failure stay in `result`.
    [[nodiscard]] static std::error_code load(
        const std::filesystem::path& path,
        FlatFileLoadResult& result);

    // Check if a regular file exists at `path`.
    [[nodiscard]] static bool exists(const std::filesystem::path& path);

    // Serialise `entries` into the on-disk text.
    [[nodiscard]] static std::string encode(
        const std::map<std::string, std::string>& entries);

    // Decode one line (without its '\n').  Splits on the first TAB, so the
    // value may itself contain TABs.  Returns nullopt for an empty or
    // delimiter-less line.
    [[nodiscard]] static std::optional<std::pair<std::string, std::string>>
    decode_line(std::string_view line);
};

} // namespace flatkv::persistence
