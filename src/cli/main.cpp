#include "common/logger.hpp"
#include "network/protocol.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/program_options.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// ── REPL coroutine ────────────────────────────────────────────────────────────
//
// One line from stdin → one write; one read of up to kReadBufferSize bytes →
// printed as the response.  "quit" is sent to the server so it can close its
// side, then the client exits without waiting for a reply.

asio::awaitable<void> repl(tcp::socket socket) {
    std::array<char, flatkv::network::kReadBufferSize> recv_buf{};

    std::string line;
    while (true) {
        fprintf(stdout, "Enter command (or 'quit' to exit): ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        // Nothing would be sent, so no reply would ever arrive.
        if (line.empty()) {
            continue;
        }

        boost::system::error_code ec;
        co_await asio::async_write(
            socket, asio::buffer(line), asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            spdlog::error("flatkv-cli: send error: {}", ec.message());
            break;
        }

        if (flatkv::network::is_quit(line)) {
            fprintf(stdout, "Exiting client.\n");
            break;
        }

        const std::size_t n = co_await socket.async_read_some(
            asio::buffer(recv_buf), asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            if (ec == asio::error::eof) {
                fprintf(stdout, "Server disconnected.\n");
            } else {
                spdlog::error("flatkv-cli: recv error: {}", ec.message());
            }
            break;
        }

        const std::string response(recv_buf.data(), n);
        fprintf(stdout, "Response: %s\n", response.c_str());
    }

    boost::system::error_code ec;
    socket.close(ec);
    if (ec) {
        spdlog::debug("flatkv-cli: close: {}", ec.message());
    }
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("flatkv-cli options");
    desc.add_options()
        ("help,h",                                                     "Show this help")
        ("host",        po::value<std::string>()->default_value("127.0.0.1"), "Server host")
        ("port,p",      po::value<std::uint16_t>()->default_value(3490),      "Server port")
        ("log-level,l", po::value<std::string>()->default_value("warn"),      "Log level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const auto host      = vm["host"].as<std::string>();
    const auto port      = vm["port"].as<std::uint16_t>();
    const auto log_level = vm["log-level"].as<std::string>();

    flatkv::init_default_logger(flatkv::parse_log_level(log_level));

    spdlog::debug("flatkv-cli connecting to {}:{}", host, port);

    try {
        asio::io_context ioc;
        tcp::resolver resolver{ioc};
        auto endpoints = resolver.resolve(host, std::to_string(port));

        tcp::socket socket{ioc};
        boost::system::error_code ec;
        asio::connect(socket, endpoints, ec);

        if (ec) {
            fprintf(stdout, "Failed to connect to server: %s\n", ec.message().c_str());
            return 1;
        }

        socket.set_option(tcp::no_delay(true));

        fprintf(stdout, "Connected to server at %s:%u\n", host.c_str(), static_cast<unsigned>(port));

        asio::co_spawn(ioc, repl(std::move(socket)), asio::detached);
        ioc.run();

    } catch (const std::exception& ex) {
        spdlog::error("flatkv-cli: exception: {}", ex.what());
        return 1;
    }

    return 0;
}
