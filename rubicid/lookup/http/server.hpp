// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>
#include <tuple>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <rubicid/infra/concurrency/task.hpp>
#include <rubicid/lookup/lookup_service.hpp>

namespace rubicid::lookup::http {

//! The top-level class of the HTTP server.
//! \details One server per execution context: all of them bind the same end-point sharing the port (SO_REUSEPORT)
class Server {
  public:
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //! Construct the server to listen on the specified local TCP end-point
    Server(std::string_view end_point, boost::asio::io_context& ioc, LookupService& service);

    void start();

    //! Close the acceptor, established connections end with their execution context
    void stop();

    //! The local end-point the server is bound to
    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

    static std::tuple<std::string, std::string> parse_endpoint(std::string_view tcp_end_point);

  private:
    Task<void> run();

    //! The acceptor used to listen for incoming TCP connections
    boost::asio::ip::tcp::acceptor acceptor_;

    //! The lookup service of the execution context
    LookupService& service_;
};

}  // namespace rubicid::lookup::http
