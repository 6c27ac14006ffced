// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "request_handler.hpp"

#include <exception>
#include <utility>

#include <absl/strings/match.h>

#include <rubicid/core/common/util.hpp>
#include <rubicid/db/errors.hpp>
#include <rubicid/infra/common/log.hpp>

namespace rubicid::lookup::http {

namespace beast_http = boost::beast::http;

static constexpr std::string_view kTokenPrefix{"/token/"};
static constexpr std::string_view kBatchPath{"/tokens/batch"};
static constexpr std::string_view kHealthPath{"/health"};
static constexpr std::string_view kApiDocsPath{"/api-docs"};
static constexpr std::string_view kJsonContentType{"application/json"};

static constexpr std::string_view kApiDocs{
    "Token CID lookup API\n"
    "\n"
    "GET  /token/{cid}\n"
    "     200 {\"cid\", \"content\", \"token_level\", \"token_number\"}\n"
    "     404 {\"error\": \"not_found\", \"cid\"}\n"
    "\n"
    "POST /tokens/batch\n"
    "     body {\"cids\": [cid, ...]} with Content-Type: application/json, duplicates are looked up once\n"
    "     200 {\"results\": {cid: {\"cid\", \"content\", \"token_level\", \"token_number\"}, ...},\n"
    "          \"not_found\": [cid, ...], \"total_requested\", \"total_found\", \"total_not_found\"}\n"
    "     400 {\"error\"} on malformed body, {\"error\", \"max\", \"received\"} when the batch is too large\n"
    "\n"
    "GET  /health\n"
    "     200 {\"status\": \"ok\"}\n"
    "     503 {\"status\": \"unavailable\"}\n"
    "\n"
    "GET  /api-docs\n"
    "     200 this document\n"};

std::string_view api_docs() { return kApiDocs; }

nlohmann::json make_entry_json(const db::CidCacheEntry& entry) {
    return {
        {"cid", entry.cid},
        {"content", entry.content},
        {"token_level", entry.key.level},
        {"token_number", entry.key.number},
    };
}

static Response make_response(const Request& request, beast_http::status status, std::string body,
                              std::string_view content_type = kJsonContentType) {
    Response response{status, request.version()};
    response.set(beast_http::field::content_type, boost::beast::string_view{content_type.data(), content_type.size()});
    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

// Cids echoed back come from the client and may hold invalid UTF-8
static std::string dump_json(const nlohmann::json& json) {
    return json.dump(/*indent=*/-1, /*indent_char=*/' ', /*ensure_ascii=*/false, nlohmann::json::error_handler_t::replace);
}

static Response make_json_response(const Request& request, beast_http::status status, const nlohmann::json& json) {
    return make_response(request, status, dump_json(json));
}

static Response make_error_response(const Request& request, beast_http::status status, std::string_view error) {
    return make_json_response(request, status, nlohmann::json{{"error", std::string{error}}});
}

Response make_body_too_large_response(unsigned version, uint64_t limit) {
    Response response{beast_http::status::bad_request, version};
    response.set(beast_http::field::content_type, boost::beast::string_view{kJsonContentType.data(), kJsonContentType.size()});
    response.keep_alive(false);
    response.body() = dump_json({{"error", "Request body too large"}, {"max_bytes", limit}});
    response.prepare_payload();
    return response;
}

static Response method_not_allowed(const Request& request, std::string_view allowed) {
    auto response{make_error_response(request, beast_http::status::method_not_allowed, "method_not_allowed")};
    response.set(beast_http::field::allow, boost::beast::string_view{allowed.data(), allowed.size()});
    return response;
}

Response RequestHandler::handle(const Request& request) {
    std::string_view target{request.target().data(), request.target().size()};
    target = target.substr(0, target.find('?'));
    RCID_TRACE << "RequestHandler::handle " << request.method_string() << " " << target;

    try {
        if (target.starts_with(kTokenPrefix)) {
            if (request.method() != beast_http::verb::get) return method_not_allowed(request, "GET");
            return handle_get_token(request, target.substr(kTokenPrefix.size()));
        }
        if (target == kBatchPath) {
            if (request.method() != beast_http::verb::post) return method_not_allowed(request, "POST");
            return handle_batch(request);
        }
        if (target == kHealthPath) {
            if (request.method() != beast_http::verb::get) return method_not_allowed(request, "GET");
            return handle_health(request);
        }
        if (target == kApiDocsPath) {
            if (request.method() != beast_http::verb::get) return method_not_allowed(request, "GET");
            return handle_api_docs(request);
        }
        return make_error_response(request, beast_http::status::not_found, "not_found");
    } catch (const std::exception& ex) {
        return internal_error(request, ex);
    }
}

Response RequestHandler::handle_get_token(const Request& request, std::string_view cid) {
    if (cid.empty() || cid.find('/') != std::string_view::npos) {
        return make_error_response(request, beast_http::status::not_found, "not_found");
    }
    const auto entry{service_.get_one(cid)};
    if (!entry) {
        return make_json_response(request, beast_http::status::not_found, {{"error", "not_found"}, {"cid", std::string{cid}}});
    }
    return make_json_response(request, beast_http::status::ok, make_entry_json(*entry));
}

Response RequestHandler::handle_batch(const Request& request) {
    const auto content_type{request[beast_http::field::content_type]};
    if (!absl::StartsWithIgnoreCase(std::string_view{content_type.data(), content_type.size()}, kJsonContentType)) {
        return make_error_response(request, beast_http::status::bad_request, "Content-Type must be application/json");
    }

    const auto body{nlohmann::json::parse(request.body(), /*cb=*/nullptr, /*allow_exceptions=*/false)};
    if (body.is_discarded() || !body.is_object()) {
        return make_error_response(request, beast_http::status::bad_request, "Request body must be a JSON object");
    }
    const auto cids_it{body.find("cids")};
    if (cids_it == body.end()) {
        return make_error_response(request, beast_http::status::bad_request, "Missing 'cids' field in request body");
    }
    if (!cids_it->is_array()) {
        return make_error_response(request, beast_http::status::bad_request, "'cids' must be an array");
    }

    std::vector<std::string> cids;
    cids.reserve(cids_it->size());
    for (const auto& cid : *cids_it) {
        if (!cid.is_string()) {
            return make_error_response(request, beast_http::status::bad_request, "'cids' must contain only strings");
        }
        cids.push_back(cid.get<std::string>());
    }

    BatchLookupResult result;
    try {
        result = service_.get_batch(cids);
    } catch (const BatchTooLargeError& ex) {
        return make_json_response(request, beast_http::status::bad_request,
                                  {{"error", ex.what()}, {"max", ex.max_size()}, {"received", ex.received()}});
    } catch (const RequestValidationError& ex) {
        return make_error_response(request, beast_http::status::bad_request, ex.what());
    }

    nlohmann::json results = nlohmann::json::object();
    for (const auto& entry : result.results) {
        results[entry.cid] = make_entry_json(entry);
    }
    const nlohmann::json reply{
        {"results", std::move(results)},
        {"not_found", result.not_found},
        {"total_requested", result.total_requested},
        {"total_found", result.total_found()},
        {"total_not_found", result.total_not_found()},
    };
    return make_json_response(request, beast_http::status::ok, reply);
}

Response RequestHandler::handle_health(const Request& request) {
    if (!service_.health()) {
        return make_json_response(request, beast_http::status::service_unavailable, {{"status", "unavailable"}});
    }
    return make_json_response(request, beast_http::status::ok, {{"status", "ok"}});
}

Response RequestHandler::handle_api_docs(const Request& request) {
    return make_response(request, beast_http::status::ok, std::string{kApiDocs}, "text/plain; charset=utf-8");
}

Response RequestHandler::internal_error(const Request& request, const std::exception& ex) {
    const uint64_t reference_value{reference_generator_.generate_one()};
    Bytes reference_bytes(sizeof(reference_value), 0);
    for (size_t i{0}; i < sizeof(reference_value); ++i) {
        reference_bytes[i] = static_cast<uint8_t>(reference_value >> (8 * i));
    }
    const auto reference{to_hex(reference_bytes)};
    log::Error("Request failed", {"reference", reference,
                                  "target", std::string{request.target().data(), request.target().size()},
                                  "error", ex.what()});
    return make_json_response(request, beast_http::status::internal_server_error,
                              {{"error", "internal_error"}, {"reference", reference}});
}

}  // namespace rubicid::lookup::http
