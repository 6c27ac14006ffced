// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <rubicid/ipfs/node_context.hpp>
#include <rubicid/ipfs/storage_client.hpp>

namespace rubicid::ipfs {

//! \brief Storage network client running the node command line tool once per operation
//! \details Each command runs in a child process with a private copy of the environment where IPFS_PATH points at
//! the node repository. The parent process environment is never modified.
class IpfsCliClient : public StorageClient {
  public:
    //! \throws StorageError if the command line binary cannot be located
    explicit IpfsCliClient(NodeContext context);

    std::string fetch(std::string_view cid) override;
    std::string add(std::string_view content, const AddOptions& options) override;
    bool is_pinned(std::string_view cid) override;
    void pin(std::string_view cid) override;

    const NodeContext& context() const { return context_; }

  private:
    struct CommandResult {
        bool timed_out{false};
        int exit_code{-1};
        std::string out;
        std::string err;

        bool succeeded() const { return !timed_out && exit_code == 0; }
    };

    //! \throws boost::process::process_error if the child cannot be spawned
    CommandResult run(const std::vector<std::string>& args, std::string_view input,
                      std::chrono::milliseconds timeout) const;

    //! \brief Same as run, any failure to spawn, wait for or read the child is rethrown as \p Error
    template <class Error>
    CommandResult run_or_throw(const std::vector<std::string>& args, std::string_view input,
                               std::chrono::milliseconds timeout) const;

    static std::string describe(const std::vector<std::string>& args, const CommandResult& result);

    NodeContext context_;
    std::string executable_;
};

}  // namespace rubicid::ipfs
