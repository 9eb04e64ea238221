#include "dash/command.hpp"
#include "dash.pb.h"
#include "dash/message.hpp"
#include <glog/logging.h>
#include <unordered_map>

namespace dash
{

static const std::unordered_map<std::string, action_t> action_map = {
    {"play", action_t::play},
    {"pause", action_t::pause},
    {"toggle", action_t::toggle},
    {"next", action_t::next},
    {"previous", action_t::previous},
    {"seek", action_t::seek},
    {"volume", action_t::volume},
    {"stop", action_t::stop},
    {"play_episode", action_t::play_episode},
    {"play_podcast_episode", action_t::play_podcast_episode},
    {"request_podcast_info", action_t::request_podcast_info},
    {"request_podcast_list", action_t::request_podcast_list},
    {"request_recent_episodes", action_t::request_recent_episodes},
    {"request_podcast_episodes", action_t::request_podcast_episodes},
    {"request_media_channels", action_t::request_media_channels},
    {"select_media_channel", action_t::select_media_channel},
    {"check_connection", action_t::check_connection},
    {"check_all_connections", action_t::check_all_connections},
    {"request_queue", action_t::request_queue},
    {"queue_shift", action_t::queue_shift},
    {"shuffle_on", action_t::shuffle_on},
    {"shuffle_off", action_t::shuffle_off},
    {"repeat_off", action_t::repeat_off},
    {"repeat_track", action_t::repeat_track},
    {"repeat_context", action_t::repeat_context},
    {"like_track", action_t::like_track},
    {"unlike_track", action_t::unlike_track},
    {"request_spotify_state", action_t::request_spotify_state},
    {"library_overview", action_t::library_overview},
    {"library_recent", action_t::library_recent},
    {"library_liked", action_t::library_liked},
    {"library_albums", action_t::library_albums},
    {"library_playlists", action_t::library_playlists},
    {"library_artists", action_t::library_artists},
    {"play_uri", action_t::play_uri},
};

const char *action_name(action_t action)
{
    if (action == action_t::unknown)
        return "unknown";
    if (action == action_t::invalid)
        return "invalid";
    for (auto &it : action_map)
    {
        if (it.second == action)
            return it.first.c_str();
    }
    return "invalid";
}

template <typename T> static std::optional<T> optional_of(bool has, const T &value)
{
    if (has)
        return value;
    return {};
}

command_t parse_command(const buffer_t &bytes)
{
    command_t command;
    proto::PlaybackCommand msg;
    try
    {
        decode_json(bytes.to_string(), msg);
    } catch (dash_protocol_exception &e)
    {
        VLOG(1) << "command: " << e.what();
        return command;
    }
    if (msg.action().empty())
        return command;

    command.name = msg.action();
    auto it = action_map.find(msg.action());
    command.action = it == action_map.end() ? action_t::unknown : it->second;
    command.value = msg.value();
    command.podcast_id = optional_of(msg.has_podcast_id(), msg.podcast_id());
    command.episode_hash = optional_of(msg.has_episode_hash(), msg.episode_hash());
    if (msg.has_episode_index())
        command.episode_index = msg.episode_index();
    if (msg.has_offset())
        command.offset = msg.offset();
    if (msg.has_limit())
        command.limit = msg.limit();
    command.channel = optional_of(msg.has_channel(), msg.channel());
    command.service = optional_of(msg.has_service(), msg.service());
    if (msg.has_queue_index())
        command.queue_index = msg.queue_index();
    command.track_id = optional_of(msg.has_track_id(), msg.track_id());
    command.uri = optional_of(msg.has_uri(), msg.uri());
    command.after = optional_of(msg.has_after(), msg.after());
    return command;
}

std::optional<art_request_t> parse_art_request(const buffer_t &bytes)
{
    proto::AlbumArtRequest msg;
    try
    {
        decode_json(bytes.to_string(), msg);
    } catch (dash_protocol_exception &e)
    {
        VLOG(1) << "artwork request: " << e.what();
        return {};
    }

    auto hash = parse_hash_string(msg.hash());
    if (!hash)
        return {};
    art_request_t request;
    request.hash = *hash;
    return request;
}

std::optional<lyrics_request_t> parse_lyrics_request(const buffer_t &bytes)
{
    proto::LyricsRequest msg;
    try
    {
        decode_json(bytes.to_string(), msg);
    } catch (dash_protocol_exception &e)
    {
        VLOG(1) << "lyrics request: " << e.what();
        return {};
    }

    lyrics_request_t request;
    if (msg.action() == "get")
        request.action = lyrics_action::get;
    else if (msg.action() == "clear")
        request.action = lyrics_action::clear;
    else
        return {};
    request.hash = optional_of(msg.has_hash(), msg.hash());
    request.artist = optional_of(msg.has_artist(), msg.artist());
    request.track = optional_of(msg.has_track(), msg.track());
    return request;
}

dispatcher_t::dispatcher_t()
    : dropped(0)
{
}

bool dispatcher_t::dispatch(const peer_id_t &peer, channel_t channel, const buffer_t &bytes)
{
    try
    {
        switch (channel)
        {
            case channel_t::playback_control: {
                auto command = parse_command(bytes);
                if (command.action == action_t::invalid)
                    throw dash_protocol_exception("malformed command", protocol_error::bad_json);
                if (command.action == action_t::unknown)
                    throw dash_protocol_exception("unknown action '" + command.name + "'", protocol_error::bad_field);

                LOG(INFO) << "command " << command.name << " from " << peer;
                if (command.action == action_t::request_podcast_info)
                {
                    if (!podcast_info_handler)
                        return false;
                    podcast_info_handler(*this, peer);
                    return true;
                }
                if (!command_handler)
                    return false;
                command_handler(*this, peer, command);
                return true;
            }
            case channel_t::art_request: {
                auto request = parse_art_request(bytes);
                if (!request)
                    throw dash_protocol_exception("malformed artwork request", protocol_error::bad_field);
                LOG(INFO) << "artwork request " << request->hash << " from " << peer;
                if (!art_request_handler)
                    return false;
                art_request_handler(*this, peer, *request);
                return true;
            }
            case channel_t::lyrics_request: {
                auto request = parse_lyrics_request(bytes);
                if (!request)
                    throw dash_protocol_exception("malformed lyrics request", protocol_error::bad_field);
                LOG(INFO) << "lyrics request from " << peer;
                if (!lyrics_request_handler)
                    return false;
                lyrics_request_handler(*this, peer, *request);
                return true;
            }
            default:
                throw dash_protocol_exception(std::string("write on ") + channel_name(channel),
                                              protocol_error::unknown_channel);
        }
    } catch (dash_protocol_exception &e)
    {
        dropped++;
        LOG(WARNING) << "drop " << bytes.get_length() << " bytes from " << peer << ": " << e.what() << " ("
                     << protocol_error_strings[(int)e.get_error()] << ")";
        return false;
    }
}

dispatcher_t &dispatcher_t::on_command(command_handler_t handler)
{
    command_handler = handler;
    return *this;
}

dispatcher_t &dispatcher_t::on_art_request(art_request_handler_t handler)
{
    art_request_handler = handler;
    return *this;
}

dispatcher_t &dispatcher_t::on_lyrics_request(lyrics_request_handler_t handler)
{
    lyrics_request_handler = handler;
    return *this;
}

dispatcher_t &dispatcher_t::on_podcast_info_request(podcast_info_handler_t handler)
{
    podcast_info_handler = handler;
    return *this;
}

} // namespace dash
