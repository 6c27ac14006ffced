// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <rubicid/infra/concurrency/task.hpp>
#include <rubicid/lookup/http/request_handler.hpp>
#include <rubicid/lookup/lookup_service.hpp>

namespace rubicid::lookup::http {

//! Represents a single connection from a client.
class Connection {
  public:
    //! Run the asynchronous read loop for the specified connection.
    //! \note This is co_spawn-friendly because the connection lifetime is tied to the coroutine frame
    static Task<void> run_read_loop(std::shared_ptr<Connection> connection);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    //! Construct a connection served by the lookup service of its execution context.
    Connection(boost::asio::ip::tcp::socket socket, LookupService& service);
    ~Connection();

  private:
    //! Start the asynchronous read loop for the connection
    Task<void> read_loop();

    //! Perform an asynchronous read operation, returns false when the connection must be closed.
    Task<bool> do_read();

    //! Perform an asynchronous write operation.
    Task<void> do_write(Response& response);

    static std::string get_date_time();

    //! Socket for the connection.
    boost::asio::ip::tcp::socket socket_;

    //! The handler used to process the incoming requests.
    RequestHandler handler_;

    boost::beast::flat_buffer data_;
};

}  // namespace rubicid::lookup::http
