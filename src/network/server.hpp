#pragma once

#include "common/server_config.hpp"
#include "storage/store.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace flatkv::network {

// Pending-connection queue length passed to listen().
inline constexpr int kListenBacklog = 10;

// Pause before accepting again after a failed accept (e.g. EMFILE), so a
// condition that persists does not turn the accept loop into a busy spin.
inline constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

// Owns the io_context and TCP acceptor.
//
// Usage:
//   auto store = std::make_shared<Store>(cfg.data_file);
//   Server srv{cfg, store};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    // Opens, binds and listens immediately (SO_REUSEADDR, backlog 10).
    // Throws boost::system::system_error if the endpoint cannot be bound.
    Server(const ServerConfig& config, std::shared_ptr<Store> store);

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Closes the acceptor and stops the io_context, causing run() to return.
    // Sessions still open are abandoned, not drained.  Safe to call from any
    // thread, before or during run().
    void stop();

    // Port actually bound (differs from the configured one when it was 0).
    [[nodiscard]] std::uint16_t local_port() const;

private:
    // Accept loop coroutine – one Session coroutine per accepted socket.
    // Runs until the acceptor is closed; a failed accept is logged and
    // retried after kAcceptRetryDelay.
    boost::asio::awaitable<void> accept_loop();

    std::string host_;
    std::shared_ptr<Store> store_;

    boost::asio::io_context ioc_;
    // Serialises the accept loop with stop(); sessions run on ioc_ directly.
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace flatkv::network
