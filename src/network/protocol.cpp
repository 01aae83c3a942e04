#include "network/protocol.hpp"
#include "common/text.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace flatkv::network {

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ErrorResp> parse_command(std::string_view line) {
    line = trim(line);
    if (line.empty()) {
        return ErrorResp{"Empty command"};
    }

    const std::vector<std::string_view> tokens = split_whitespace(line);
    const std::string verb = to_upper(tokens[0]);

    // ── SET key value ─────────────────────────────────────────────────────────
    if (verb == "SET") {
        if (tokens.size() != 3) {
            return ErrorResp{"SET command requires 2 arguments: key and value"};
        }
        return SetCmd{std::string(tokens[1]), std::string(tokens[2])};
    }

    // ── GET key ───────────────────────────────────────────────────────────────
    if (verb == "GET") {
        if (tokens.size() != 2) {
            return ErrorResp{"GET command requires 1 argument: key"};
        }
        return GetCmd{std::string(tokens[1])};
    }

    // ── REMOVE key ────────────────────────────────────────────────────────────
    if (verb == "REMOVE") {
        if (tokens.size() != 2) {
            return ErrorResp{"REMOVE command requires 1 argument: key"};
        }
        return RemoveCmd{std::string(tokens[1])};
    }

    // ── PRINT ─────────────────────────────────────────────────────────────────
    // Trailing tokens are ignored.
    if (verb == "PRINT") {
        return PrintCmd{};
    }

    return ErrorResp{"Unknown command '" + std::string(tokens[0]) + "'"};
}

// ── serialize_error ───────────────────────────────────────────────────────────

std::string serialize_error(const ErrorResp& error) {
    return "ERROR: " + error.message + "\n";
}

// ── is_quit ───────────────────────────────────────────────────────────────────

bool is_quit(std::string_view line) {
    return to_lower(trim(line)) == kQuitCommand;
}

// ── is_valid_utf8 ─────────────────────────────────────────────────────────────

bool is_valid_utf8(std::string_view bytes) noexcept {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto c = static_cast<std::uint8_t>(bytes[i]);

        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > bytes.size()) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<std::uint8_t>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates, beyond U+10FFFF.
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace flatkv::network
