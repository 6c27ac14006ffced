// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rubicid/db/mdbx.hpp>

/*
Part of the compatibility layer with the on-disk layout of the index data directory.

HashIndex
---------
key   : token hash (32 bytes)
value : level (1 byte) + token number (BE 4 bytes)

BuildProgress
-------------
key   : progress marker name (ASCII)
value : last committed token number (BE 4 bytes)

CidCache
--------
key   : cid (ASCII)
value : level (1 byte) + token number (BE 4 bytes) + token content (ASCII 67 bytes)

CidCacheRanges
--------------
key   : level (1 byte) + range start (BE 4 bytes) + range end (BE 4 bytes)
value : completion time as seconds since epoch (BE 8 bytes)
*/

namespace rubicid::db::table {

inline constexpr db::MapConfig kHashIndex{"HashIndex"};
inline constexpr db::MapConfig kBuildProgress{"BuildProgress"};
inline constexpr db::MapConfig kCidCache{"CidCache"};
inline constexpr db::MapConfig kCidCacheRanges{"CidCacheRanges"};

inline constexpr const char* kHashIndexWatermark{"HashIndex"};

}  // namespace rubicid::db::table
