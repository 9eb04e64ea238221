#include "dash/session.hpp"
#include <glog/logging.h>

namespace dash
{

transport_session_t::transport_session_t(notifier_t &notifier, session_config_t config, time_source_t &source)
    : config(config)
    , notifier(notifier)
    , registry(config.default_mtu, config.att_overhead)
    , throttle(source, config.throttle_interval)
    , multiplexer(registry, notifier, throttle, config.mux_max_packet)
    , transmitter(registry, notifier, throttle, config.ack_timeout)
    , cache(config.art_cache_capacity)
    , correlator(transmitter, config.correlation_deadline, &cache, nullptr)
    , last_request(0)
    , request_active(false)
    , request_generation(0)
    , pool(config.threads)
{
    bind_handlers();
}

transport_session_t::~transport_session_t() { shutdown(); }

void transport_session_t::bind_handlers()
{
    registry
        .on_peer_disconnect([this](peer_registry_t &, const peer_id_t &peer) {
            transmitter.forget(peer);
            correlator.cancel_peer(peer);
        })
        .on_primary_subscribe(
            [this](peer_registry_t &, const peer_id_t &peer) { handle_primary_subscribe(peer); });

    dispatcher
        .on_command([this](dispatcher_t &, const peer_id_t &peer, const command_t &command) {
            handle_command(peer, command);
        })
        .on_podcast_info_request([this](dispatcher_t &, const peer_id_t &peer) {
            command_t command;
            command.action = action_t::request_podcast_info;
            command.name = action_name(command.action);
            handle_command(peer, command);
        })
        .on_art_request([this](dispatcher_t &, const peer_id_t &peer, const art_request_t &request) {
            handle_art_request(peer, request.hash);
        })
        .on_lyrics_request([this](dispatcher_t &, const peer_id_t &peer, const lyrics_request_t &request) {
            handle_lyrics_request(peer, request);
        });
}

void transport_session_t::handle_primary_subscribe(const peer_id_t &peer)
{
    std::optional<std::string> state;
    {
        std::unique_lock<std::mutex> lock(mutex);
        state = media_state;
    }
    if (state)
    {
        LOG(INFO) << "initial media state to " << peer;
        multiplexer.send_untagged_to(peer, channel_t::media_state, buffer_t::from_string(*state));
    }
    pool.commit_after(config.time_sync_delay, [this, peer]() { send_time_sync(peer); });
}

void transport_session_t::handle_command(const peer_id_t &peer, const command_t &command)
{
    payload_producer_t *producer = nullptr;
    command_handler_t handler;
    {
        std::unique_lock<std::mutex> lock(mutex);
        auto it = producers.find((int)command.action);
        if (it != producers.end())
            producer = it->second;
        handler = command_handler;
    }

    if (producer)
    {
        auto payload = producer->produce(command);
        if (!payload)
        {
            LOG(WARNING) << "nothing to answer " << command.name << " from " << peer;
            return;
        }
        multiplexer.send(payload->type, payload->data);
        return;
    }
    if (handler)
    {
        handler(*this, peer, command);
        return;
    }
    VLOG(1) << "command " << command.name << " not handled";
}

correlation_result transport_session_t::handle_art_request(const peer_id_t &peer, art_hash_t hash)
{
    last_request = hash;
    request_active = true;
    u64 generation = ++request_generation;
    pool.commit_after(config.request_indicator_hold, [this, generation]() {
        if (request_generation == generation)
            request_active = false;
    });

    auto result = correlator.resolve(peer, hash);
    LOG(INFO) << "artwork request " << hash << " from " << peer << ": "
              << correlation_result_strings[(int)result];
    return result;
}

void transport_session_t::handle_lyrics_request(const peer_id_t &peer, const lyrics_request_t &request)
{
    if (request.action == lyrics_action::clear)
    {
        notify_lyrics_clear(request.hash.value_or(""));
        return;
    }
    lyrics_handler_t handler;
    {
        std::unique_lock<std::mutex> lock(mutex);
        handler = lyrics_handler;
    }
    if (handler)
        handler(*this, peer, request);
    else
        VLOG(1) << "lyrics request from " << peer << " not handled";
}

void transport_session_t::on_connect(const peer_id_t &peer) { registry.on_connect(peer); }

void transport_session_t::on_disconnect(const peer_id_t &peer) { registry.on_disconnect(peer); }

void transport_session_t::on_subscribe(const peer_id_t &peer, channel_t channel, bool enabled)
{
    if (!registry.set_subscribed(peer, channel, enabled))
        LOG(WARNING) << "subscription change from unknown peer " << peer;
}

void transport_session_t::on_mtu_changed(const peer_id_t &peer, u16 mtu) { registry.negotiate_mtu(peer, mtu); }

void transport_session_t::on_write(const peer_id_t &peer, channel_t channel, buffer_t bytes)
{
    pool.commit([this, peer, channel, bytes]() { dispatcher.dispatch(peer, channel, bytes); });
}

void transport_session_t::on_notification_sent(const peer_id_t &peer, int status)
{
    transmitter.on_notification_sent(peer, status);
}

buffer_t transport_session_t::read_media_state(u64 offset)
{
    std::string json;
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (media_state)
            json = *media_state;
    }
    if (json.empty())
        json = encode_json(empty_media_state());
    if (offset >= json.size())
        return buffer_t(0);
    return buffer_t::from_string(json.substr(offset));
}

u64 transport_session_t::notify_media_state(const proto::MediaState &state)
{
    auto json = encode_json(state);
    {
        std::unique_lock<std::mutex> lock(mutex);
        media_state = json;
    }
    if (state.has_album_art_hash())
    {
        auto hash = parse_hash_string(state.album_art_hash());
        if (hash)
            correlator.set_expected(*hash);
        else
        {
            LOG(WARNING) << "media state carries a malformed artwork hash '" << state.album_art_hash() << "'";
            correlator.clear_expected();
        }
    }
    else
    {
        correlator.clear_expected();
    }
    return multiplexer.send_untagged(channel_t::media_state, buffer_t::from_string(json));
}

void transport_session_t::publish_artwork(art_hash_t hash, const buffer_t &image)
{
    correlator.publish(hash, prepare_chunks(hash, image, config.art_chunk_size));
}

void transport_session_t::cache_artwork(art_hash_t hash, const buffer_t &image)
{
    cache.put(hash, prepare_chunks(hash, image, config.art_chunk_size));
}

u64 transport_session_t::notify_response(u8 type, const buffer_t &payload) { return multiplexer.send(type, payload); }

u64 transport_session_t::notify_media_channels(const std::vector<std::string> &channels)
{
    return multiplexer.send(response_type::media_channels, encode_media_channels(channels));
}

u64 transport_session_t::notify_connection_status(const std::map<std::string, std::string> &services)
{
    proto::ConnectionStatus status;
    for (auto &it : services)
    {
        (*status.mutable_services())[it.first] = it.second;
    }
    status.set_timestamp(get_timestamp() / 1000000);
    return multiplexer.send(response_type::connection_status, to_buffer(status));
}

u64 transport_session_t::notify_queue(const proto::QueueResponse &queue)
{
    return multiplexer.send(response_type::playback_queue, to_buffer(queue));
}

u64 transport_session_t::notify_lyrics(const std::string &hash, bool synced, const std::vector<lyrics_line_t> &lines)
{
    auto chunks = make_lyrics_chunks(hash, synced, lines);
    if (chunks.empty())
    {
        LOG(WARNING) << "no lyrics lines to send for " << hash;
        return 0;
    }
    std::vector<buffer_t> payloads;
    payloads.reserve(chunks.size());
    for (auto &chunk : chunks)
    {
        payloads.emplace_back(to_buffer(chunk));
    }

    auto peers = registry.subscribers(channel_t::lyrics_data);
    LOG(INFO) << "lyrics " << hash << ": " << lines.size() << " lines in " << chunks.size() << " chunks to "
              << peers.size() << " peers";
    u64 delivered = 0;
    for (auto &peer : peers)
    {
        bool ok = true;
        for (u64 i = 0; i < payloads.size() && ok; i++)
        {
            ok = multiplexer.send_tagged_to(peer, channel_t::lyrics_data, i, payloads[i], config.lyrics_packet) ==
                 send_result::ok;
        }
        if (ok)
            delivered++;
    }
    return delivered;
}

u64 transport_session_t::notify_lyrics_clear(const std::string &hash)
{
    LOG(INFO) << "lyrics clear " << (hash.empty() ? "(all)" : hash);
    return multiplexer.send_untagged(channel_t::lyrics_data, to_buffer(lyrics_clear_chunk(hash)));
}

u64 transport_session_t::notify_settings(const std::map<std::string, setting_value_t> &settings)
{
    return multiplexer.send_untagged(channel_t::settings, encode_settings(settings));
}

send_result transport_session_t::send_time_sync(const peer_id_t &peer)
{
    auto text = current_time_sync();
    auto result = multiplexer.send_untagged_to(peer, channel_t::time_sync, buffer_t::from_string(text));
    if (result == send_result::ok)
        LOG(INFO) << "time sync to " << peer << ": " << text;
    return result;
}

correlation_result transport_session_t::request_artwork(const peer_id_t &peer, art_hash_t hash)
{
    return handle_art_request(peer, hash);
}

void transport_session_t::shutdown()
{
    for (auto &peer : registry.connected_peers())
    {
        transmitter.forget(peer);
    }
    correlator.cancel_all();
    registry.clear();
    throttle.reset();
}

transport_session_t &transport_session_t::register_producer(action_t action, payload_producer_t *producer)
{
    std::unique_lock<std::mutex> lock(mutex);
    producers[(int)action] = producer;
    return *this;
}

transport_session_t &transport_session_t::on_command(command_handler_t handler)
{
    std::unique_lock<std::mutex> lock(mutex);
    command_handler = handler;
    return *this;
}

transport_session_t &transport_session_t::on_lyrics_request(lyrics_handler_t handler)
{
    std::unique_lock<std::mutex> lock(mutex);
    lyrics_handler = handler;
    return *this;
}

} // namespace dash
