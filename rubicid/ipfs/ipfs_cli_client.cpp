// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ipfs_cli_client.hpp"

#include <future>
#include <system_error>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_join.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <rubicid/infra/common/ipfs_config.hpp>
#include <rubicid/infra/common/log.hpp>

namespace rubicid::ipfs {

namespace bp = boost::process;

static std::string locate_executable(const std::string& binary) {
    if (binary.find('/') != std::string::npos) {
        return binary;
    }
    const auto located{bp::search_path(binary)};
    if (located.empty()) {
        throw StorageError{"storage network binary not found in PATH: " + binary};
    }
    return located.string();
}

IpfsCliClient::IpfsCliClient(NodeContext context)
    : context_{std::move(context)}, executable_{locate_executable(context_.ipfs_binary)} {}

IpfsCliClient::CommandResult IpfsCliClient::run(const std::vector<std::string>& args, std::string_view input,
                                                std::chrono::milliseconds timeout) const {
    bp::environment env = boost::this_process::environment();
    env[kIpfsPathKey] = context_.ipfs_path.string();

    boost::asio::io_context ioc;
    std::future<std::string> out;
    std::future<std::string> err;
    const std::string stdin_data{input};

    bp::child child{bp::exe = executable_, bp::args = args,
                    bp::std_in < boost::asio::buffer(stdin_data),
                    bp::std_out > out,
                    bp::std_err > err,
                    env, ioc};

    ioc.run_for(timeout);
    if (!ioc.stopped()) {
        std::error_code ec;
        child.terminate(ec);
        if (ec) {
            RCID_WARN << "IpfsCliClient: cannot terminate timed out command: " << ec.message();
        }
        return CommandResult{.timed_out = true};
    }
    child.wait();
    return CommandResult{.exit_code = child.exit_code(), .out = out.get(), .err = err.get()};
}

template <class Error>
IpfsCliClient::CommandResult IpfsCliClient::run_or_throw(const std::vector<std::string>& args, std::string_view input,
                                                         std::chrono::milliseconds timeout) const {
    try {
        return run(args, input, timeout);
    } catch (const bp::process_error& pe) {
        throw Error{std::string{"cannot spawn storage network command: "} + pe.what()};
    } catch (const std::system_error& se) {
        throw Error{"ipfs " + absl::StrJoin(args, " ") + " failed: " + se.what()};
    } catch (const std::future_error& fe) {
        throw Error{"ipfs " + absl::StrJoin(args, " ") + " output lost: " + fe.what()};
    }
}

std::string IpfsCliClient::describe(const std::vector<std::string>& args, const CommandResult& result) {
    std::string description{"ipfs " + absl::StrJoin(args, " ")};
    if (result.timed_out) {
        return description + " timed out";
    }
    return description + " exited with code " + std::to_string(result.exit_code) + ": " +
           std::string{absl::StripAsciiWhitespace(result.err)};
}

std::string IpfsCliClient::fetch(std::string_view cid) {
    const std::vector<std::string> args{"cat", std::string{cid}};
    auto result{run_or_throw<FetchError>(args, {}, context_.fetch_timeout)};
    if (!result.succeeded()) {
        throw FetchError{describe(args, result)};
    }
    return std::move(result.out);
}

std::string IpfsCliClient::add(std::string_view content, const AddOptions& options) {
    std::vector<std::string> args{"add"};
    if (options.only_hash) {
        args.emplace_back("--pin=false");
        args.emplace_back("--only-hash");
    } else {
        args.emplace_back(options.pin ? "--pin=true" : "--pin=false");
    }
    args.emplace_back("-Q");

    auto result{run_or_throw<AddError>(args, content, context_.add_timeout)};
    if (!result.succeeded()) {
        throw AddError{describe(args, result)};
    }
    const auto cid{absl::StripAsciiWhitespace(result.out)};
    if (cid.empty()) {
        throw AddError{"ipfs add returned no cid"};
    }
    return std::string{cid};
}

bool IpfsCliClient::is_pinned(std::string_view cid) {
    const std::vector<std::string> args{"pin", "ls", std::string{cid}};
    auto result{run_or_throw<PinError>(args, {}, context_.pin_timeout)};
    if (result.timed_out) {
        throw PinError{describe(args, result)};
    }
    // Not pinned is reported as a failure exit code
    return result.exit_code == 0 && result.out.find(cid) != std::string::npos;
}

void IpfsCliClient::pin(std::string_view cid) {
    const std::vector<std::string> args{"pin", "add", std::string{cid}};
    auto result{run_or_throw<PinError>(args, {}, context_.pin_timeout)};
    if (!result.succeeded()) {
        throw PinError{describe(args, result)};
    }
    RCID_TRACE << "IpfsCliClient: pinned " << cid << " on " << context_.node_name;
}

}  // namespace rubicid::ipfs
