/**
* \file mux.hpp
* \author DashLink developers
* \brief Tagged fragment framing. Many response kinds share the podcast info channel, each fragment carries
* [type][index][total] in front of its slice of the payload.
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
#include <optional>
#include <unordered_map>
#include <vector>

namespace dash
{

namespace response_type
{
enum : u8
{
    /// current state channel, never multiplexed
    untagged = 0,
    podcast_list = 1,
    recent_episodes,
    podcast_episodes,
    media_channels,
    connection_status,
    playback_queue,
    playback_state,
    library_overview,
    track_list,
    album_list,
    playlist_list,
    artist_list,
};
}

#pragma pack(push, 1)

struct mux_header_t
{
    u8 type;
    u8 index;
    u8 total;
    using member_list_t = serialization::typelist_t<u8, u8, u8>;
};

#pragma pack(pop)

inline constexpr u16 mux_header_size = sizeof(mux_header_t);
/// 500 bytes of payload plus the header
inline constexpr u16 mux_max_packet = 503;

/// cut 'payload' into slices of at most 'capacity' bytes. An empty payload still yields one empty slice.
///\note slices share memory with 'payload'
///\throw dash_param_exception when capacity is 0
std::vector<buffer_t> split_payload(const buffer_t &payload, u64 capacity);

/// header + body. index and total are truncated to one byte each
buffer_t encode_fragment(u8 type, u64 index, u64 total, const buffer_t &body);

class multiplexer_t
{
    peer_registry_t &registry;
    notifier_t &notifier;
    throttle_t &throttle;
    u16 max_packet;

  public:
    ///\param max_packet upper bound of one notification, header included
    multiplexer_t(peer_registry_t &registry, notifier_t &notifier, throttle_t &throttle,
                  u16 max_packet = mux_max_packet);

    multiplexer_t(const multiplexer_t &) = delete;
    multiplexer_t &operator=(const multiplexer_t &) = delete;

    /// min(max_packet, negotiated payload) - header
    u64 fragment_capacity(const peer_id_t &peer) const;

    /// send to every peer subscribed to the podcast info channel
    ///\return count of peers which got every fragment
    u64 send(u8 type, const buffer_t &payload);

    send_result send_to(const peer_id_t &peer, u8 type, const buffer_t &payload);

    /// frame 'payload' with [tag][index][total] into slices of 'capacity' bytes and send them on 'channel'.
    /// stop at the first refused fragment
    send_result send_tagged_to(const peer_id_t &peer, channel_t channel, u8 tag, const buffer_t &payload,
                               u64 capacity);

    /// one notification without header to every subscriber of 'channel'
    ///\return count of peers which accepted it
    u64 send_untagged(channel_t channel, const buffer_t &payload);

    send_result send_untagged_to(const peer_id_t &peer, channel_t channel, const buffer_t &payload);
};

struct mux_message_t
{
    u8 type;
    buffer_t payload;
};

/// Peer side reassembly, one partial payload per tag.
class mux_decoder_t
{
    struct partial_t
    {
        u8 total;
        u8 next;
        std::vector<u8> data;
    };
    std::unordered_map<u8, partial_t> partials;

  public:
    /// feed one fragment.
    ///\return the whole payload once the last fragment arrived in order
    ///\throw dash_protocol_exception when fragment is shorter than the header
    std::optional<mux_message_t> feed(const buffer_t &fragment);

    /// count of tags with an unfinished payload
    u64 pending() const { return partials.size(); }
};

} // namespace dash
