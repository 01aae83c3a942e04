#include "persistence/flat_file.hpp"
#include "common/text.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace flatkv::persistence {

namespace {

constexpr std::size_t kReadChunkSize = 4096;

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data,
                                        std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Decode every complete line at the front of `pending` into `result`,
// leaving a trailing partial line in place.
void drain_lines(std::string& pending, FlatFileLoadResult& result) {
    std::size_t start = 0;
    for (;;) {
        const auto nl = pending.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        const std::string_view line{pending.data() + start, nl - start};
        if (auto entry = FlatFile::decode_line(line)) {
            result.entries.insert_or_assign(std::move(entry->first),
                                            std::move(entry->second));
        } else if (!trim(line).empty()) {
            ++result.skipped_lines;
        }
        start = nl + 1;
    }
    pending.erase(0, start);
}

}  // namespace

// ── FlatFile::encode ─────────────────────────────────────────────────────────

std::string FlatFile::encode(const std::map<std::string, std::string>& entries) {
    std::string out;
    for (const auto& [key, value] : entries) {
        out.append(key);
        out.push_back(kDelimiter);
        out.append(value);
        out.push_back('\n');
    }
    return out;
}

// ── FlatFile::decode_line ────────────────────────────────────────────────────

std::optional<std::pair<std::string, std::string>>
FlatFile::decode_line(std::string_view line) {
    line = trim(line);
    if (line.empty()) {
        return std::nullopt;
    }
    const auto pos = line.find(kDelimiter);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(std::string(line.substr(0, pos)),
                          std::string(line.substr(pos + 1)));
}

// ── FlatFile::save ───────────────────────────────────────────────────────────

std::error_code FlatFile::save(
    const std::filesystem::path& path,
    const std::map<std::string, std::string>& entries) {

    const std::string buf = encode(entries);

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("FlatFile: failed to open {} for writing: {}",
                      path.string(), ec.message());
        return ec;
    }

    auto ec = write_all(fd, buf.data(), buf.size());
    if (ec) {
        spdlog::error("FlatFile: write to {} failed: {}", path.string(),
                      ec.message());
        ::close(fd);
        return ec;
    }

    if (::close(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::error("FlatFile: close of {} failed: {}", path.string(),
                      ec.message());
        return ec;
    }

    spdlog::debug("FlatFile: saved {} entries ({} bytes) to {}",
                  entries.size(), buf.size(), path.string());
    return {};
}

// ── FlatFile::load ───────────────────────────────────────────────────────────

std::error_code FlatFile::load(
    const std::filesystem::path& path,
    FlatFileLoadResult& result) {

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("FlatFile: failed to open {}: {}", path.string(),
                      ec.message());
        return ec;
    }

    std::string pending;
    char chunk[kReadChunkSize];
    for (;;) {
        auto n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = std::error_code{errno, std::system_category()};
            ::close(fd);
            spdlog::error("FlatFile: read of {} failed after {} entries: {}",
                          path.string(), result.entries.size(), ec.message());
            return ec;
        }
        if (n == 0) {
            break;
        }
        pending.append(chunk, static_cast<std::size_t>(n));
        drain_lines(pending, result);
    }
    ::close(fd);

    // Last line without a trailing newline.
    if (!pending.empty()) {
        pending.push_back('\n');
        drain_lines(pending, result);
    }

    spdlog::debug("FlatFile: loaded {} entries from {} ({} malformed lines skipped)",
                  result.entries.size(), path.string(), result.skipped_lines);
    return {};
}

// ── FlatFile::exists ─────────────────────────────────────────────────────────

bool FlatFile::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace flatkv::persistence
