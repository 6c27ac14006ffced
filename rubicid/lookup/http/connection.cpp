// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "connection.hpp"

#include <exception>
#include <shared_mutex>
#include <sstream>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <rubicid/core/common/base.hpp>
#include <rubicid/infra/common/log.hpp>

namespace rubicid::lookup::http {

//! Largest accepted request body: a full batch of cids with generous room for JSON framing
static constexpr uint64_t kMaxPayloadSize{4 * kMebi};

Task<void> Connection::run_read_loop(std::shared_ptr<Connection> connection) {
    co_await connection->read_loop();
}

Connection::Connection(boost::asio::ip::tcp::socket socket, LookupService& service)
    : socket_{std::move(socket)}, handler_{service} {
    socket_.set_option(boost::asio::ip::tcp::socket::keep_alive(true));
    RCID_TRACE << "Connection::Connection created for " << socket_.remote_endpoint();
}

Connection::~Connection() {
    boost::system::error_code ec;
    socket_.close(ec);
    RCID_TRACE << "Connection::~Connection socket " << &socket_ << " deleted";
}

Task<void> Connection::read_loop() {
    try {
        bool continue_processing{true};
        while (continue_processing) {
            continue_processing = co_await do_read();
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() == boost::beast::http::error::end_of_stream) {
            RCID_TRACE << "Connection::read_loop received graceful close";
        } else {
            RCID_TRACE << "Connection::read_loop system_error: " << se.code();
        }
    } catch (const std::exception& e) {
        RCID_ERROR << "Connection::read_loop exception: " << e.what();
    }
}

Task<bool> Connection::do_read() {
    RCID_TRACE << "Connection::do_read going to read...";

    boost::beast::http::request_parser<boost::beast::http::string_body> parser;
    parser.body_limit(kMaxPayloadSize);

    bool body_too_large{false};
    try {
        const auto bytes_transferred = co_await boost::beast::http::async_read(socket_, data_, parser, boost::asio::use_awaitable);
        RCID_TRACE << "Connection::do_read bytes_read: " << bytes_transferred;
    } catch (const boost::system::system_error& se) {
        if (se.code() != boost::beast::http::error::body_limit) throw;
        body_too_large = true;
    }
    if (body_too_large) {
        // The rest of the body is never read, so the connection cannot be reused
        RCID_TRACE << "Connection::do_read request body exceeds " << kMaxPayloadSize << " bytes";
        auto response{make_body_too_large_response(parser.get().version(), kMaxPayloadSize)};
        co_await do_write(response);
        co_return false;
    }

    if (!parser.is_done()) {
        co_return true;
    }

    const auto request{parser.release()};
    auto response{handler_.handle(request)};
    co_await do_write(response);
    co_return request.keep_alive();
}

Task<void> Connection::do_write(Response& response) {
    try {
        response.set(boost::beast::http::field::date, get_date_time());
        response.prepare_payload();
        const auto bytes_transferred = co_await boost::beast::http::async_write(socket_, response, boost::asio::use_awaitable);
        RCID_TRACE << "Connection::do_write status: " << response.result_int() << " bytes_transferred: " << bytes_transferred;
    } catch (const boost::system::system_error& se) {
        RCID_TRACE << "Connection::do_write system_error: " << se.what();
        throw;
    } catch (const std::exception& e) {
        RCID_ERROR << "Connection::do_write exception: " << e.what();
        throw;
    }
}

std::string Connection::get_date_time() {
    static const absl::TimeZone kTz{absl::UTCTimeZone()};
    static std::pair<int64_t, std::string> cache;
    static std::shared_mutex cache_mutex;

    std::pair<int64_t, std::string> result;
    {
        std::shared_lock lock{cache_mutex};
        result = cache;
    }

    const int64_t ts = absl::ToUnixSeconds(absl::Now());
    if (ts == result.first) {
        return std::move(result.second);
    }

    const absl::Time now = absl::FromUnixSeconds(ts);
    result = {ts, absl::FormatTime("%a, %d %b %E4Y %H:%M:%S GMT", now, kTz)};

    // update cache if timestamp increased
    {
        std::unique_lock lock{cache_mutex};
        if (ts > cache.first) {
            cache = result;
        }
    }

    return std::move(result.second);
}

}  // namespace rubicid::lookup::http
