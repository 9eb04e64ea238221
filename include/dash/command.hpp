/**
* \file command.hpp
* \author DashLink developers
* \brief Inbound requests written by the peer: playback commands, artwork requests and lyrics requests. Payloads are
* small JSON objects arriving in one write, parsed strictly into closed types and routed to handlers.
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
#include "registry.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <string>

namespace dash
{

enum class action_t
{
    play,
    pause,
    toggle,
    next,
    previous,
    seek,
    volume,
    stop,
    play_episode,
    /// deprecated, by episode index
    play_podcast_episode,
    /// legacy full podcast dump
    request_podcast_info,
    request_podcast_list,
    request_recent_episodes,
    request_podcast_episodes,
    request_media_channels,
    select_media_channel,
    check_connection,
    check_all_connections,
    request_queue,
    queue_shift,
    shuffle_on,
    shuffle_off,
    repeat_off,
    repeat_track,
    repeat_context,
    like_track,
    unlike_track,
    request_spotify_state,
    library_overview,
    library_recent,
    library_liked,
    library_albums,
    library_playlists,
    library_artists,
    play_uri,
    /// well formed, action string not recognised
    unknown,
    /// not parseable
    invalid,
};

/// wire name of 'action', "unknown"/"invalid" for the two fallback values
const char *action_name(action_t action);

struct command_t
{
    action_t action;
    /// action string as received
    std::string name;
    /// volume 0-100, seek milliseconds
    i64 value;
    std::optional<std::string> podcast_id;
    std::optional<std::string> episode_hash;
    int episode_index;
    int offset;
    int limit;
    std::optional<std::string> channel;
    std::optional<std::string> service;
    int queue_index;
    std::optional<std::string> track_id;
    std::optional<std::string> uri;
    std::optional<std::string> after;

    command_t()
        : action(action_t::invalid)
        , value(0)
        , episode_index(-1)
        , offset(0)
        , limit(20)
        , queue_index(-1)
    {
    }
};

struct art_request_t
{
    art_hash_t hash;
};

enum class lyrics_action
{
    get,
    clear,
};

struct lyrics_request_t
{
    lyrics_action action;
    std::optional<std::string> hash;
    std::optional<std::string> artist;
    std::optional<std::string> track;
};

/// never throws. action is action_t::invalid for malformed JSON and action_t::unknown for an unrecognised action
command_t parse_command(const buffer_t &bytes);

/// nullopt when malformed or when hash is not a decimal u32
std::optional<art_request_t> parse_art_request(const buffer_t &bytes);

/// nullopt when malformed or action is neither "get" nor "clear"
std::optional<lyrics_request_t> parse_lyrics_request(const buffer_t &bytes);

/// routes writes on the inbound channels to their handlers. Malformed payloads are logged and dropped.
class dispatcher_t
{
  public:
    using command_handler_t = std::function<void(dispatcher_t &, const peer_id_t &, const command_t &)>;
    using art_request_handler_t = std::function<void(dispatcher_t &, const peer_id_t &, const art_request_t &)>;
    using lyrics_request_handler_t = std::function<void(dispatcher_t &, const peer_id_t &, const lyrics_request_t &)>;
    using podcast_info_handler_t = std::function<void(dispatcher_t &, const peer_id_t &)>;

  private:
    command_handler_t command_handler;
    art_request_handler_t art_request_handler;
    lyrics_request_handler_t lyrics_request_handler;
    podcast_info_handler_t podcast_info_handler;
    std::atomic<u64> dropped;

  public:
    dispatcher_t();

    dispatcher_t(const dispatcher_t &) = delete;
    dispatcher_t &operator=(const dispatcher_t &) = delete;

    ///\return true when a handler took the payload
    bool dispatch(const peer_id_t &peer, channel_t channel, const buffer_t &bytes);

    dispatcher_t &on_command(command_handler_t handler);
    dispatcher_t &on_art_request(art_request_handler_t handler);
    dispatcher_t &on_lyrics_request(lyrics_request_handler_t handler);
    /// legacy request_podcast_info action
    dispatcher_t &on_podcast_info_request(podcast_info_handler_t handler);

    /// count of payloads dropped so far
    u64 get_dropped() const { return dropped; }
};

} // namespace dash
