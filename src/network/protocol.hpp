#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace flatkv {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of a single client command.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct SetCmd {
    std::string key;
    std::string value;
};

struct GetCmd {
    std::string key;
};

struct RemoveCmd {
    std::string key;
};

struct PrintCmd {};

using Command = std::variant<SetCmd, GetCmd, RemoveCmd, PrintCmd>;

// A protocol-level failure (empty line, unknown verb, bad arity).  Not an
// exception: it is sent back as a normal response and the session goes on.
struct ErrorResp {
    std::string message;
};

// ── Protocol ──────────────────────────────────────────────────────────────────

namespace network {

// Bytes taken from the socket per request.  Longer payloads are not
// reassembled: the rest arrives as the next request.
inline constexpr std::size_t kReadBufferSize = 1024;

// Session-level verb; never reaches the parser.
inline constexpr std::string_view kQuitCommand = "quit";

// Stateless helper: parse one command line into a Command.
// Surrounding whitespace is ignored, tokens are split on any whitespace and
// the verb is case-insensitive.  Keys and values keep their case.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, ErrorResp> parse_command(std::string_view line);

// "ERROR: <message>\n"
[[nodiscard]] std::string serialize_error(const ErrorResp& error);

// True for "quit" in any letter case, ignoring surrounding whitespace.
[[nodiscard]] bool is_quit(std::string_view line);

// True if `bytes` is well-formed UTF-8.
[[nodiscard]] bool is_valid_utf8(std::string_view bytes) noexcept;

} // namespace network
} // namespace flatkv
