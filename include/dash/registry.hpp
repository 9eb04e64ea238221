/**
* \file registry.hpp
* \author DashLink developers
* \brief connected peers, their channel subscriptions and negotiated payload ceiling
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
#include "dash.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace dash
{

/// logical endpoints of the link. 'out' channels notify the peer, 'in' channels are written by it
enum class channel_t : u8
{
    /// out, untagged current state. subscribing to it triggers the initial push
    media_state = 0,
    /// in, command json
    playback_control,
    /// in, artwork request json
    art_request,
    /// out, binary artwork fragments
    art_data,
    /// out, multiplexed responses
    podcast_info,
    /// in, lyrics request json
    lyrics_request,
    /// out, lyrics packets
    lyrics_data,
    /// out, settings json
    settings,
    /// out, time sync text
    time_sync,
};

inline constexpr int channel_count = 9;

static const char *channel_strings[] = {"media_state",  "playback_control", "art_request",
                                        "art_data",     "podcast_info",     "lyrics_request",
                                        "lyrics_data",  "settings",         "time_sync"};

inline const char *channel_name(channel_t channel) { return channel_strings[(int)channel]; }

/// ATT header bytes taken from every notification
inline constexpr u16 att_overhead = 3;
/// MTU every peer starts with before negotiation
inline constexpr u16 default_mtu = 23;

struct peer_info_t
{
    peer_id_t id;
    /// bit n set when subscribed to channel_t(n)
    u32 subscriptions;
    u16 mtu;
    peer_info_t(peer_id_t id, u16 mtu)
        : id(id)
        , subscriptions(0)
        , mtu(mtu)
    {
    }

    bool subscribed(channel_t channel) const { return subscriptions & (1u << (u32)channel); }
};

class peer_registry_t
{
  public:
    using peer_disconnect_t = std::function<void(peer_registry_t &, const peer_id_t &)>;
    using primary_subscribe_t = std::function<void(peer_registry_t &, const peer_id_t &)>;

  private:
    mutable std::shared_mutex mutex;
    std::unordered_map<peer_id_t, std::unique_ptr<peer_info_t>> peers;
    u16 initial_mtu;
    u16 overhead;

    peer_disconnect_t disconnect_handler;
    primary_subscribe_t primary_subscribe_handler;

  public:
    peer_registry_t(u16 initial_mtu = default_mtu, u16 overhead = att_overhead);

    peer_registry_t(const peer_registry_t &) = delete;
    peer_registry_t &operator=(const peer_registry_t &) = delete;

    /// add peer, no-op when already known
    void on_connect(const peer_id_t &peer);
    /// remove peer and all of its subscriptions, then fire the disconnect handler
    void on_disconnect(const peer_id_t &peer);

    /// record or clear notification eligibility.
    ///\return false when peer is unknown
    bool set_subscribed(const peer_id_t &peer, channel_t channel, bool enabled);

    /// record a negotiated MTU.
    ///\return false when peer is unknown
    bool negotiate_mtu(const peer_id_t &peer, u16 mtu);

    /// return mtu - overhead, never below the pre-negotiation ceiling (20 bytes for default settings)
    u16 negotiated_payload(const peer_id_t &peer) const;

    bool is_connected(const peer_id_t &peer) const;
    bool is_subscribed(const peer_id_t &peer, channel_t channel) const;

    /// snapshot of peers subscribed to 'channel'
    std::vector<peer_id_t> subscribers(channel_t channel) const;
    std::vector<peer_id_t> connected_peers() const;
    u64 count() const;

    /// drop every peer. handlers are not fired
    void clear();

    peer_registry_t &on_peer_disconnect(peer_disconnect_t handler);
    /// fired once per peer when it newly subscribes to channel_t::media_state
    peer_registry_t &on_primary_subscribe(primary_subscribe_t handler);
};

} // namespace dash
