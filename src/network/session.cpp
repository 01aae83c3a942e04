#include "network/session.hpp"
#include "common/text.hpp"
#include "network/protocol.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <utility>

namespace flatkv::network {

namespace {

using boost::asio::redirect_error;
using boost::asio::use_awaitable;

// EOF and reset are the normal ways a client goes away.
bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset;
}

} // namespace

Session::Session(boost::asio::ip::tcp::socket socket, std::shared_ptr<Store> store)
    : socket_(std::move(socket)), interpreter_(std::move(store)) {}

std::optional<std::string> Session::respond(std::string_view chunk) const {
    if (is_quit(chunk)) {
        return std::nullopt;
    }
    return interpreter_.execute(chunk);
}

boost::asio::awaitable<void> Session::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    spdlog::info("Session {}: connected", remote);

    std::array<char, kReadBufferSize> buf{};

    for (;;) {
        boost::system::error_code ec;
        const std::size_t n = co_await socket_.async_read_some(
            boost::asio::buffer(buf), redirect_error(use_awaitable, ec));

        if (ec) {
            if (is_disconnect(ec)) {
                spdlog::info("Session {}: client disconnected", remote);
            } else {
                spdlog::warn("Session {}: read error: {}", remote, ec.message());
            }
            break;
        }

        const std::string_view chunk{buf.data(), n};
        if (!is_valid_utf8(chunk)) {
            spdlog::warn("Session {}: received {} bytes of invalid UTF-8, closing",
                         remote, n);
            break;
        }

        spdlog::debug("Session {}: recv '{}'", remote, trim(chunk));

        auto response = respond(chunk);
        if (!response) {
            spdlog::info("Session {}: client requested to quit", remote);
            break;
        }

        co_await boost::asio::async_write(
            socket_, boost::asio::buffer(*response), redirect_error(use_awaitable, ec));

        if (ec) {
            spdlog::warn("Session {}: write error: {}", remote, ec.message());
            break;
        }

        spdlog::debug("Session {}: sent '{}'", remote, trim(*response));
    }

    close(remote);
}

void Session::close(const std::string& remote) {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        spdlog::debug("Session {}: shutdown: {}", remote, ec.message());
    }
    socket_.close(ec);
    if (ec) {
        spdlog::warn("Session {}: close failed: {}", remote, ec.message());
    }
    spdlog::info("Session {}: connection closed", remote);
}

} // namespace flatkv::network
