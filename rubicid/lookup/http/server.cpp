// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "server.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <rubicid/infra/common/log.hpp>
#include <rubicid/lookup/http/connection.hpp>

namespace rubicid::lookup::http {

using reuse_port = boost::asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;

static constexpr char kAddressPortSeparator{':'};

std::tuple<std::string, std::string> Server::parse_endpoint(std::string_view tcp_end_point) {
    const auto separator{tcp_end_point.rfind(kAddressPortSeparator)};
    if (separator == std::string_view::npos) {
        throw std::invalid_argument{"invalid end-point: " + std::string{tcp_end_point}};
    }
    return {std::string{tcp_end_point.substr(0, separator)}, std::string{tcp_end_point.substr(separator + 1)}};
}

Server::Server(std::string_view end_point, boost::asio::io_context& ioc, LookupService& service)
    : acceptor_{ioc}, service_{service} {
    const auto [host, port] = parse_endpoint(end_point);

    // Open the acceptor with the option to reuse the address (i.e. SO_REUSEADDR).
    boost::asio::ip::tcp::resolver resolver{acceptor_.get_executor()};
    boost::asio::ip::tcp::endpoint endpoint = *resolver.resolve(host, port).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.set_option(reuse_port(true));
    acceptor_.bind(endpoint);
}

void Server::start() {
    boost::asio::co_spawn(acceptor_.get_executor(), run(), [&](const std::exception_ptr& eptr) {
        if (eptr) std::rethrow_exception(eptr);
    });
}

void Server::stop() {
    boost::asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

Task<void> Server::run() {
    auto this_executor = co_await boost::asio::this_coro::executor;
    try {
        acceptor_.listen();
        while (acceptor_.is_open()) {
            RCID_TRACE << "Server::run accepting using executor " << &this_executor << "...";

            boost::asio::ip::tcp::socket socket{this_executor};
            co_await acceptor_.async_accept(socket, boost::asio::use_awaitable);
            if (!acceptor_.is_open()) {
                RCID_TRACE << "Server::run returning...";
                co_return;
            }

            RCID_TRACE << "Server::run accepted connection from " << socket.remote_endpoint();

            auto new_connection = std::make_shared<Connection>(std::move(socket), service_);
            boost::asio::co_spawn(this_executor, Connection::run_read_loop(new_connection), boost::asio::detached);
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() != boost::asio::error::operation_aborted) {
            RCID_ERROR << "Server::run system_error: " << se.what();
            throw;
        }
        RCID_DEBUG << "Server::run operation_aborted: " << se.what();
    }
    RCID_DEBUG << "Server::run exiting...";
}

}  // namespace rubicid::lookup::http
