#pragma once

#include "network/command_interpreter.hpp"
#include "storage/store.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace flatkv::network {

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and runs until the
// client disconnects, sends "quit", sends bytes that are not UTF-8, or an I/O
// error occurs.  Requests of one connection are served strictly in order:
// the coroutine reads, dispatches and writes before reading again.
//
// Framing: one async_read_some() of at most kReadBufferSize bytes is one
// request.  Nothing is buffered across reads.
//
// The socket is owned by the Session.  run() shuts it down and closes it on
// every exit path; if the coroutine is abandoned by a stopped io_context, the
// socket_ member closes it when the Session is destroyed.
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket, std::shared_ptr<Store> store);

    // Main coroutine.  Returns when the connection is finished.
    boost::asio::awaitable<void> run();

    // Response for one received chunk, or nullopt if the chunk is "quit" and
    // the session must end without replying.
    [[nodiscard]] std::optional<std::string> respond(std::string_view chunk) const;

private:
    void close(const std::string& remote);

    boost::asio::ip::tcp::socket socket_;
    CommandInterpreter interpreter_;
};

} // namespace flatkv::network
