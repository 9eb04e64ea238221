/**
* \file message.hpp
* \author DashLink developers
* \brief Payload encoders for everything the host pushes besides artwork: JSON state objects, lyrics chunks, settings,
* the media channel list and the time sync text. Also the JSON helpers shared with the inbound parsers.
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
#include "dash.pb.h"
#include <google/protobuf/message.h>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dash
{

/// parse JSON into 'msg', unknown fields ignored
///\throw dash_protocol_exception when json is malformed or a field has a wrong type
void decode_json(const std::string &json, google::protobuf::Message &msg);

/// compact JSON, lowerCamelCase names, default values printed
std::string encode_json(const google::protobuf::Message &msg);

inline buffer_t to_buffer(const google::protobuf::Message &msg) { return buffer_t::from_string(encode_json(msg)); }

/// CRC32 of lower(trim(artist)) + "|" + lower(trim(album))
art_hash_t art_hash(const std::string &artist, const std::string &album);

/// decimal form used in JSON
std::string hash_string(art_hash_t hash);

/// inverse of hash_string. nullopt unless 'str' is a decimal number fitting in 32 bits
std::optional<art_hash_t> parse_hash_string(const std::string &str);

/// state sent before anything is playing
proto::MediaState empty_media_state();

/// big endian u16 count then [len:u8][utf-8] per name. count capped at 65535, names at 255 bytes
buffer_t encode_media_channels(const std::vector<std::string> &channels);

///\throw dash_protocol_exception when truncated
std::vector<std::string> decode_media_channels(const buffer_t &bytes);

inline constexpr u32 lyrics_lines_per_chunk = 20;

struct lyrics_line_t
{
    /// milliseconds from track start, 0 when not synced
    i32 time;
    std::string text;
};

/// split lyrics into chunks of at most 'lines_per_chunk' lines
std::vector<proto::LyricsChunk> make_lyrics_chunks(const std::string &hash, bool synced,
                                                   const std::vector<lyrics_line_t> &lines,
                                                   u32 lines_per_chunk = lyrics_lines_per_chunk);

/// empty lyrics telling the peer to drop what it shows
proto::LyricsChunk lyrics_clear_chunk(const std::string &hash);

using setting_value_t = std::variant<bool, double, std::string>;

/// flat JSON object
buffer_t encode_settings(const std::map<std::string, setting_value_t> &settings);

/// "<unix seconds>|<utc offset minutes>|<zone id>"
std::string time_sync_text(i64 unix_seconds, int offset_minutes, const std::string &zone);

/// time sync text for now, local zone
std::string current_time_sync();

/// $TZ, else the /etc/localtime link target below zoneinfo, else "UTC"
std::string local_zone_id();

} // namespace dash
