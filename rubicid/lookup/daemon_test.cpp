// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "daemon.hpp"

#include <boost/beast/http.hpp>
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include <rubicid/db/cid_cache.hpp>
#include <rubicid/infra/common/directories.hpp>
#include <rubicid/infra/test_util/log.hpp>

namespace rubicid::lookup {

namespace beast_http = boost::beast::http;

TEST_CASE("Daemon", "[rubicid][lookup][daemon]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const TemporaryDirectory tmp_dir;
    auto env{db::open_env(db::EnvConfig{.path = tmp_dir.path().string(), .create = true, .inmemory = true})};
    const db::CidCacheEntry entry{
        .cid = "QmeoeiBuMJbjaCqfbhEcbvwt3EV9E3iDhhD1yYrxBbZain",
        .content = "003f4a5ac9cd7498503f8ab1b5f4f62454703e3cfef47886861d776819d3be9fdbb",
        .key = {.level = 3, .number = 1'662'242},
    };
    db::CidCacheWriter writer{env};
    writer.commit_batch({entry});

    SECTION("serves lookups from every context") {
        DaemonSettings settings{
            .context_pool_settings = {.num_contexts = 1},
            .data_dir = tmp_dir.path(),
            .http_end_point = "127.0.0.1:0",
        };
        Daemon daemon{settings, env};
        daemon.start();
        REQUIRE(daemon.servers().size() == 1);

        boost::asio::io_context client_ioc;
        boost::asio::ip::tcp::socket socket{client_ioc};
        socket.connect(boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"),
                                                      daemon.servers()[0]->local_endpoint().port()});
        beast_http::request<beast_http::string_body> request{beast_http::verb::get, "/token/" + entry.cid, 11};
        beast_http::write(socket, request);
        boost::beast::flat_buffer buffer;
        beast_http::response<beast_http::string_body> response;
        beast_http::read(socket, buffer, response);
        CHECK(response.result() == beast_http::status::ok);
        CHECK(nlohmann::json::parse(response.body())["content"] == entry.content);
        socket.close();

        daemon.stop();
        daemon.join();
    }
}

}  // namespace rubicid::lookup
