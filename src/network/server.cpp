#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace flatkv::network {

Server::Server(const ServerConfig& config, std::shared_ptr<Store> store)
    : host_(config.host),
      store_(std::move(store)),
      ioc_(static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))),
      strand_(boost::asio::make_strand(ioc_)),
      acceptor_(strand_) {
    if (!store_) {
        throw std::invalid_argument("Server requires a Store");
    }

    const auto address = boost::asio::ip::make_address(host_);
    const boost::asio::ip::tcp::endpoint endpoint{address, config.port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(kListenBacklog);

    spdlog::info("Server listening on {}:{}", host_, local_port());
}

std::uint16_t Server::local_port() const {
    return acceptor_.local_endpoint().port();
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    // Start the accept loop.
    boost::asio::co_spawn(strand_, accept_loop(), boost::asio::detached);

    // Run the io_context across a thread pool.
    const unsigned int nthreads = std::max(1u, std::thread::hardware_concurrency());
    std::vector<std::thread> pool;
    pool.reserve(nthreads - 1);
    for (unsigned int i = 1; i < nthreads; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    spdlog::info("Server: io_context stopped, all threads joined");
}

void Server::stop() {
    // Runs on the accept strand so the acceptor is never touched
    // concurrently with the accept loop.
    boost::asio::post(strand_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Server: error closing acceptor: {}", ec.message());
        }
        spdlog::info("Server socket closed");
        ioc_.stop();
    });
}

boost::asio::awaitable<void> Server::accept_loop() {
    spdlog::info("Server: accept loop started");

    boost::asio::steady_timer retry_timer{strand_};

    for (;;) {
        // Sessions get their own socket on ioc_ so they do not share the
        // accept strand.
        boost::asio::ip::tcp::socket socket{ioc_};
        boost::system::error_code ec;
        co_await acceptor_.async_accept(
            socket, boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            break; // Acceptor was closed – time to stop.
        }

        if (ec) {
            // Per-connection or resource failures (EMFILE, ECONNABORTED).
            // The listener is still open: back off and accept again.
            spdlog::warn("Server: accept error: {}, retrying in {}ms",
                         ec.message(), kAcceptRetryDelay.count());
            retry_timer.expires_after(kAcceptRetryDelay);
            co_await retry_timer.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                break;
            }
            continue;
        }

        // Disable Nagle – send responses immediately.
        socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
        if (ec) {
            spdlog::debug("Server: TCP_NODELAY not set: {}", ec.message());
        }

        // Spawn a detached coroutine for this session.
        auto session_ptr = std::make_shared<Session>(std::move(socket), store_);
        boost::asio::co_spawn(
            ioc_,
            [sp = std::move(session_ptr)]() -> boost::asio::awaitable<void> {
                co_await sp->run();
            },
            boost::asio::detached);
    }

    spdlog::info("Server: accept loop exited");
}

} // namespace flatkv::network
