/**
* \file session.hpp
* \author DashLink developers
* \brief One transport session owns the registry, throttle, multiplexer, artwork transmitter, correlator, dispatcher
* and the thread pool running their async tasks. Several sessions can live side by side.
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
#include "art.hpp"
#include "art_cache.hpp"
#include "command.hpp"
#include "correlator.hpp"
#include "message.hpp"
#include "mux.hpp"
#include "notifier.hpp"
#include "registry.hpp"
#include "thread_pool.hpp"
#include "throttle.hpp"
#include "timer.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace dash
{

struct session_config_t
{
    microsecond_t throttle_interval = make_timespan(0, 10);
    /// wait for a send completion after each artwork chunk
    microsecond_t ack_timeout = make_timespan(0, 200);
    /// wait for the expected artwork to be prepared
    microsecond_t correlation_deadline = make_timespan(5);
    /// time sync push after subscribing to the media state channel
    microsecond_t time_sync_delay = make_timespan(2);
    /// artwork request indicator stays on this long
    microsecond_t request_indicator_hold = make_timespan(3);
    u16 art_chunk_size = dash::art_chunk_size;
    u16 mux_max_packet = dash::mux_max_packet;
    u16 lyrics_packet = 500;
    u16 default_mtu = dash::default_mtu;
    u16 att_overhead = dash::att_overhead;
    int threads = 4;
    u64 art_cache_capacity = 10;
};

struct payload_t
{
    u8 type;
    buffer_t data;
};

/// application side producer of one kind of response, invoked for the commands it is registered for
class payload_producer_t
{
  public:
    ///\return nullopt when there is nothing to send
    virtual std::optional<payload_t> produce(const command_t &command) = 0;
    virtual ~payload_producer_t(){};
};

class transport_session_t
{
  public:
    using command_handler_t = std::function<void(transport_session_t &, const peer_id_t &, const command_t &)>;
    using lyrics_handler_t = std::function<void(transport_session_t &, const peer_id_t &, const lyrics_request_t &)>;

  private:
    session_config_t config;
    notifier_t &notifier;
    peer_registry_t registry;
    throttle_t throttle;
    multiplexer_t multiplexer;
    art_transmitter_t transmitter;
    art_cache_t cache;
    correlator_t correlator;
    dispatcher_t dispatcher;

    std::mutex mutex;
    std::optional<std::string> media_state;
    std::unordered_map<int, payload_producer_t *> producers;
    command_handler_t command_handler;
    lyrics_handler_t lyrics_handler;

    std::atomic<art_hash_t> last_request;
    std::atomic_bool request_active;
    std::atomic<u64> request_generation;

    /// destroyed first, so no task outlives the components above
    thread_pool_t pool;

    void bind_handlers();
    void handle_command(const peer_id_t &peer, const command_t &command);
    correlation_result handle_art_request(const peer_id_t &peer, art_hash_t hash);
    void handle_lyrics_request(const peer_id_t &peer, const lyrics_request_t &request);
    void handle_primary_subscribe(const peer_id_t &peer);

  public:
    transport_session_t(notifier_t &notifier, session_config_t config = session_config_t(),
                        time_source_t &source = system_time_source_t::instance());

    transport_session_t(const transport_session_t &) = delete;
    transport_session_t &operator=(const transport_session_t &) = delete;

    ~transport_session_t();

    // ---- radio events ----
    void on_connect(const peer_id_t &peer);
    void on_disconnect(const peer_id_t &peer);
    void on_subscribe(const peer_id_t &peer, channel_t channel, bool enabled);
    void on_mtu_changed(const peer_id_t &peer, u16 mtu);
    /// the peer wrote 'bytes' on an inbound channel. handled on the pool
    void on_write(const peer_id_t &peer, channel_t channel, buffer_t bytes);
    /// send completed callback
    void on_notification_sent(const peer_id_t &peer, int status);
    /// characteristic read of the media state, from 'offset'
    buffer_t read_media_state(u64 offset);

    // ---- application pushes, run on the calling thread ----

    /// remember and broadcast the state. its artwork hash becomes the expected artwork
    u64 notify_media_state(const proto::MediaState &state);
    /// the current track's artwork is prepared
    void publish_artwork(art_hash_t hash, const buffer_t &image);
    /// artwork of something not playing, served to requests from the cache
    void cache_artwork(art_hash_t hash, const buffer_t &image);
    /// multiplexed response to every subscriber of the podcast info channel
    u64 notify_response(u8 type, const buffer_t &payload);
    u64 notify_media_channels(const std::vector<std::string> &channels);
    u64 notify_connection_status(const std::map<std::string, std::string> &services);
    u64 notify_queue(const proto::QueueResponse &queue);
    /// lyrics packets to every subscriber of the lyrics channel
    ///\return count of peers which got every packet
    u64 notify_lyrics(const std::string &hash, bool synced, const std::vector<lyrics_line_t> &lines);
    u64 notify_lyrics_clear(const std::string &hash);
    u64 notify_settings(const std::map<std::string, setting_value_t> &settings);
    send_result send_time_sync(const peer_id_t &peer);

    /// resolve an artwork request as if 'peer' wrote it, on the calling thread
    correlation_result request_artwork(const peer_id_t &peer, art_hash_t hash);

    /// tear the channel down: cancel transfers, forget peers, reset pacing
    void shutdown();

    // ---- wiring ----
    transport_session_t &register_producer(action_t action, payload_producer_t *producer);
    /// commands without a producer
    transport_session_t &on_command(command_handler_t handler);
    transport_session_t &on_lyrics_request(lyrics_handler_t handler);
    void set_fetcher(art_fetcher_t *fetcher) { correlator.set_fetcher(fetcher); }

    art_hash_t last_art_request() const { return last_request; }
    bool art_request_active() const { return request_active; }

    const session_config_t &get_config() const { return config; }
    peer_registry_t &get_registry() { return registry; }
    throttle_t &get_throttle() { return throttle; }
    multiplexer_t &get_multiplexer() { return multiplexer; }
    art_transmitter_t &get_transmitter() { return transmitter; }
    art_cache_t &get_cache() { return cache; }
    correlator_t &get_correlator() { return correlator; }
    dispatcher_t &get_dispatcher() { return dispatcher; }
    thread_pool_t &get_pool() { return pool; }
};

} // namespace dash
