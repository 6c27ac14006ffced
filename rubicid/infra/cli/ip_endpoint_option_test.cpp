// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ip_endpoint_option.hpp"

#include <catch2/catch.hpp>

namespace rubicid::cmd::common {

static std::string validate(const IPEndpointValidator& validator, std::string value) {
    return validator(value);
}

TEST_CASE("IPEndpointValidator", "[rubicid][infra][cli][ip_endpoint]") {
    const IPEndpointValidator validator;
    CHECK(validate(validator, "0.0.0.0:5000").empty());
    CHECK(validate(validator, "127.0.0.1:1").empty());
    CHECK(validate(validator, "::1:8080").empty());
    CHECK_FALSE(validate(validator, "").empty());
    CHECK_FALSE(validate(validator, "localhost:5000").empty());
    CHECK_FALSE(validate(validator, "0.0.0.0").empty());
    CHECK_FALSE(validate(validator, "0.0.0.0:0").empty());
    CHECK_FALSE(validate(validator, "0.0.0.0:65536").empty());
    CHECK_FALSE(validate(validator, "300.0.0.1:5000").empty());

    const IPEndpointValidator allow_empty{/*allow_empty=*/true};
    CHECK(validate(allow_empty, "").empty());
}

}  // namespace rubicid::cmd::common
