// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rubicid::ipfs {

//! \brief Base class of failures reported by the storage network
class StorageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! \brief Content could not be fetched (unreachable, unknown cid or timeout)
class FetchError : public StorageError {
  public:
    using StorageError::StorageError;
};

//! \brief Content could not be added (rejected or timeout)
class AddError : public StorageError {
  public:
    using StorageError::StorageError;
};

//! \brief Content could not be pinned or pin state could not be queried
class PinError : public StorageError {
  public:
    using StorageError::StorageError;
};

struct AddOptions {
    bool only_hash{true};  // compute the cid without storing any block
    bool pin{false};       // retain the added content durably, ignored when only_hash is set
};

//! \brief Black-box content addressed storage network bound to one node
class StorageClient {
  public:
    virtual ~StorageClient() = default;

    //! \brief Content addressed by cid
    //! \throws FetchError
    virtual std::string fetch(std::string_view cid) = 0;

    //! \brief Submit content and return the cid the network assigns to it
    //! \throws AddError
    virtual std::string add(std::string_view content, const AddOptions& options) = 0;

    //! \throws PinError
    virtual bool is_pinned(std::string_view cid) = 0;

    //! \throws PinError
    virtual void pin(std::string_view cid) = 0;

    //! \brief Pin the cid unless it is already pinned
    //! \throws PinError
    void ensure_pinned(std::string_view cid) {
        if (!is_pinned(cid)) {
            pin(cid);
        }
    }
};

}  // namespace rubicid::ipfs
