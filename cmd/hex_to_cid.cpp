// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <cctype>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

#include <rubicid/core/common/decoding_exception.hpp>
#include <rubicid/core/types/cid.hpp>
#include <rubicid/core/types/token.hpp>

using namespace rubicid;

int main(int argc, char* argv[]) {
    CLI::App app{"Convert a SHA-256 hex digest into its CIDv0"};

    std::string input;
    bool content{false};
    app.add_option("hex", input, "64 hex character digest, or 67 character token content with --content")->required();
    app.add_flag("--content", content, "Accept a token content and convert its trailing hash");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    }

    std::string compact;
    for (const char c : input) {
        if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
    }
    if (compact.size() == kTokenContentLength && !content) {
        std::cerr << "Error: token content given, use --content to convert its trailing hash\n";
        return 1;
    }

    try {
        std::cout << unwrap_or_throw(hex_to_cidv0(compact), "invalid input " + compact) << "\n";
    } catch (const DecodingException& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
