/**
* \file art.hpp
* \author DashLink developers
* \brief Binary artwork transport. Raw image bytes are cut into chunks, each notified with a 16 bytes little endian
* header carrying the artwork hash, position, body length and CRC32 of the body.
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
#include "buffer.hpp"
#include "dash.hpp"
#include "endian.hpp"
#include "notifier.hpp"
#include "registry.hpp"
#include "throttle.hpp"
#include "timer.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dash
{

#pragma pack(push, 1)

struct art_chunk_header_t
{
    u32 hash;
    u16 index;
    u16 total;
    u16 length;
    u32 crc;
    u16 reserved;
    using member_list_t = serialization::typelist_t<u32, u16, u16, u16, u32, u16>;
};

#pragma pack(pop)

static_assert(sizeof(art_chunk_header_t) == 16, "artwork header is 16 bytes on the wire");

inline constexpr u16 art_header_size = sizeof(art_chunk_header_t);
/// largest body, so header + body fits in one 512 bytes notification
inline constexpr u16 art_chunk_size = 496;

struct art_chunk_t
{
    art_hash_t hash;
    u16 index;
    u16 total;
    /// CRC32 of data
    u32 crc;
    buffer_t data;
};

using art_chunks_t = std::vector<art_chunk_t>;

u32 crc32(const byte *data, u64 len);
u32 crc32(const buffer_t &data);

/// cut 'image' into chunks of 'chunk_size' bytes with CRC32 per body. An empty image yields no chunk.
///\throw dash_param_exception when chunk_size is 0 or larger than art_chunk_size, or the image needs more than
/// 65535 chunks
std::vector<art_chunk_t> prepare_chunks(art_hash_t hash, const buffer_t &image, u16 chunk_size = art_chunk_size);

///\throw dash_param_exception when the body is larger than art_chunk_size
buffer_t encode_art_chunk(const art_chunk_t &chunk);

/// peer side parser.
///\return nullopt when shorter than the header or than header + length
std::optional<art_chunk_t> decode_art_chunk(const buffer_t &bytes);

/// Single slot channel written by the "send completed" callback and read by the pacing loop. A second write before
/// the read overwrites the first.
class ack_slot_t
{
    std::mutex mutex;
    std::condition_variable cond;
    bool has_value;
    bool value;

  public:
    ack_slot_t();

    ack_slot_t(const ack_slot_t &) = delete;
    ack_slot_t &operator=(const ack_slot_t &) = delete;

    void put(bool success);
    /// wait at most 'timeout'
    ///\return nullopt on timeout
    std::optional<bool> take(microsecond_t timeout);
    void clear();
};

class art_transmitter_t
{
    struct transfer_t
    {
        art_hash_t hash;
        u64 cursor;
        u64 total;
    };

    peer_registry_t &registry;
    notifier_t &notifier;
    throttle_t &throttle;
    microsecond_t ack_timeout;

    mutable std::mutex mutex;
    /// peer -> active transfer. a transfer whose entry is removed or replaced was cancelled
    std::unordered_map<peer_id_t, std::shared_ptr<transfer_t>> transfers;
    std::unordered_map<peer_id_t, std::shared_ptr<ack_slot_t>> acks;

    bool still_active(const peer_id_t &peer, const std::shared_ptr<transfer_t> &transfer) const;
    std::shared_ptr<ack_slot_t> get_ack_slot(const peer_id_t &peer);

  public:
    art_transmitter_t(peer_registry_t &registry, notifier_t &notifier, throttle_t &throttle,
                      microsecond_t ack_timeout = make_timespan(0, 200));

    art_transmitter_t(const art_transmitter_t &) = delete;
    art_transmitter_t &operator=(const art_transmitter_t &) = delete;

    /// send every chunk in order to 'peer' on the artwork channel.
    /// blocks the caller for the whole transfer.
    ///\return rejected when a transfer to 'peer' is already active, failed when the stack refused a chunk,
    /// cancelled when cancel() or a disconnect was observed, no_peer when peer is unknown
    send_result transmit(const peer_id_t &peer, const std::vector<art_chunk_t> &chunks);

    /// stop the active transfer to 'peer' before its next chunk
    void cancel(const peer_id_t &peer);
    /// cancel and drop every per peer state of 'peer'. called when the peer goes away
    void forget(const peer_id_t &peer);

    bool is_active(const peer_id_t &peer) const;

    /// send completed callback of the radio stack
    ///\param status 0 means success
    void on_notification_sent(const peer_id_t &peer, int status);

    microsecond_t get_ack_timeout() const { return ack_timeout; }
    /// count of peers holding a send completed slot
    u64 tracked_peers() const;
};

} // namespace dash
