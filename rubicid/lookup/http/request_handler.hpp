// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <rubicid/core/common/random_number.hpp>
#include <rubicid/lookup/lookup_service.hpp>

namespace rubicid::lookup::http {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

//! \brief Maps the REST surface onto one lookup service
//! \details One handler per connection: it is not thread-safe
class RequestHandler {
  public:
    explicit RequestHandler(LookupService& service) : service_{service} {}

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    //! \brief Build the response for the request, it never throws on bad input or persistence failure
    Response handle(const Request& request);

  private:
    Response handle_get_token(const Request& request, std::string_view cid);
    Response handle_batch(const Request& request);
    Response handle_health(const Request& request);
    Response handle_api_docs(const Request& request);

    Response internal_error(const Request& request, const std::exception& ex);

    LookupService& service_;
    RandomNumber reference_generator_;
};

//! \brief JSON representation of one cached entry
nlohmann::json make_entry_json(const db::CidCacheEntry& entry);

//! \brief 400 response for a request whose body exceeds the given limit, it closes the connection
Response make_body_too_large_response(unsigned version, uint64_t limit);

//! \brief Human-readable description of the REST surface
std::string_view api_docs();

}  // namespace rubicid::lookup::http
