/**
* \file dash.hpp
* \author DashLink developers
* \brief Base definitions shared by every DashLink module. Including fixed-length integer, peer id and send result
* \version 0.1
* \date 2026-10-19
*
* @copyright Copyright (c) 2026.
This file is part of DashLink.

DashLink is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as
published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

DashLink is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with DashLink. If not, see <http: //www.gnu.org/licenses/>.
*
*/
#pragma once
#include "dash_exception.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

typedef unsigned char byte;

namespace dash
{
using i64 = int64_t;
using u64 = uint64_t;
using i32 = int32_t;
using u32 = uint32_t;
using i16 = int16_t;
using u16 = uint16_t;
using i8 = int8_t;
using u8 = uint8_t;

/// opaque remote endpoint identity (radio address)
using peer_id_t = std::string;

/// artwork hash, CRC32 of "artist|album"
using art_hash_t = u32;

enum send_result
{
    ok,
    /// the radio stack refused a fragment
    failed,
    /// single-flight: another transfer is active for the peer
    rejected,
    /// cancel() or a disconnect was observed mid-transfer
    cancelled,
    /// peer is not in the registry
    no_peer,
};

static const char *send_result_strings[] = {"ok", "failed", "rejected", "cancelled", "no peer"};

} // namespace dash
