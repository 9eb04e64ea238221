#include "dash/session.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <thread>

DEFINE_string(peer, "F0:0D:DA:50:00:01", "simulated peer address");
DEFINE_uint32(mtu, 517, "mtu negotiated by the simulated peer");
DEFINE_string(art, "", "artwork file answered to the peer's artwork request");
DEFINE_string(artist, "Nina Simone", "artist of the demo track");
DEFINE_string(album, "Pastel Blues", "album of the demo track");
DEFINE_string(title, "Sinnerman", "title of the demo track");
DEFINE_uint32(throttle_ms, 10, "minimum gap between notifications");
DEFINE_uint32(ack_ms, 200, "artwork send completion timeout");
DEFINE_uint32(correlation_ms, 5000, "wait for the expected artwork");
DEFINE_uint32(time_sync_ms, 2000, "time sync delay after subscribing");
DEFINE_uint32(prepare_ms, 300, "simulated artwork preparation time");
DEFINE_uint32(threads, 4, "threads count");
DEFINE_bool(ack, true, "simulate send completion callbacks");
DEFINE_string(log, "./dash-host.log", "log file");

static void atexit_func()
{
    LOG(INFO) << "exit host...";
    google::ShutdownGoogleLogging();
}

/// what the simulated peer puts back together
struct peer_view_t
{
    std::mutex mutex;
    dash::mux_decoder_t decoder;
    std::map<int, dash::buffer_t> responses;
    std::map<dash::u16, dash::art_chunk_t> art;
    dash::u64 bad_crc = 0;
    std::string media_state;
    std::string time_sync;
    std::string settings;
};

class queue_producer_t : public dash::payload_producer_t
{
  public:
    std::optional<dash::payload_t> produce(const dash::command_t &command) override
    {
        dash::proto::QueueResponse queue;
        queue.set_s("spotify");
        auto current = queue.mutable_c();
        current->set_t(FLAGS_title);
        current->set_a(FLAGS_artist);
        current->set_b(FLAGS_album);
        current->set_d(822);
        current->set_u("spotify:track:demo0");
        for (int i = 1; i <= 30; i++)
        {
            auto track = queue.add_q();
            track->set_t("Queued track " + std::to_string(i));
            track->set_a(FLAGS_artist);
            track->set_d(180 + i);
            track->set_u("spotify:track:demo" + std::to_string(i));
        }
        queue.set_t(dash::get_timestamp() / 1000000);
        return dash::payload_t{dash::response_type::playback_queue, dash::to_buffer(queue)};
    }
};

static dash::buffer_t read_file(const std::string &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw dash::dash_param_exception("can't open " + path);
    std::vector<dash::u8> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return dash::buffer_t::from_vector(data);
}

int main(int argc, char **argv)
{
    google::InitGoogleLogging(argv[0]);
    google::ParseCommandLineFlags(&argc, &argv, false);
    google::SetLogDestination(google::GLOG_FATAL, FLAGS_log.c_str());
    google::SetLogDestination(google::GLOG_ERROR, FLAGS_log.c_str());
    google::SetLogDestination(google::GLOG_INFO, FLAGS_log.c_str());
    google::SetLogDestination(google::GLOG_WARNING, FLAGS_log.c_str());
    google::SetStderrLogging(google::GLOG_INFO);

    atexit(atexit_func);

    dash::session_config_t config;
    config.throttle_interval = dash::make_timespan(0, FLAGS_throttle_ms);
    config.ack_timeout = dash::make_timespan(0, FLAGS_ack_ms);
    config.correlation_deadline = dash::make_timespan(0, FLAGS_correlation_ms);
    config.time_sync_delay = dash::make_timespan(0, FLAGS_time_sync_ms);
    config.threads = FLAGS_threads == 0 ? 4 : FLAGS_threads;

    peer_view_t view;
    dash::loopback_notifier_t radio;
    dash::transport_session_t session(radio, config);

    radio.on_notify([&session, &view](dash::loopback_notifier_t &, const dash::loopback_notifier_t::record_t &record) {
        auto data = dash::buffer_t::from_vector(record.data);
        std::unique_lock<std::mutex> lock(view.mutex);
        switch (record.channel)
        {
            case dash::channel_t::podcast_info: {
                auto message = view.decoder.feed(data);
                if (message)
                    view.responses[message->type] = message->payload;
                break;
            }
            case dash::channel_t::art_data: {
                auto chunk = dash::decode_art_chunk(data);
                if (chunk)
                {
                    if (dash::crc32(chunk->data) != chunk->crc)
                        view.bad_crc++;
                    view.art[chunk->index] = *chunk;
                }
                break;
            }
            case dash::channel_t::media_state:
                view.media_state = data.to_string();
                break;
            case dash::channel_t::time_sync:
                view.time_sync = data.to_string();
                break;
            case dash::channel_t::settings:
                view.settings = data.to_string();
                break;
            default:
                break;
        }
        lock.unlock();
        if (FLAGS_ack && record.channel == dash::channel_t::art_data)
            session.on_notification_sent(record.peer, 0);
    });

    queue_producer_t queue_producer;
    session.register_producer(dash::action_t::request_queue, &queue_producer);
    session.on_command([](dash::transport_session_t &, const dash::peer_id_t &peer, const dash::command_t &command) {
        LOG(INFO) << "application command " << command.name << " value " << command.value << " from " << peer;
    });

    const auto &peer = FLAGS_peer;
    LOG(INFO) << "simulated peer " << peer << " connects";
    session.on_connect(peer);
    session.on_mtu_changed(peer, FLAGS_mtu);
    for (auto channel : {dash::channel_t::podcast_info, dash::channel_t::art_data, dash::channel_t::lyrics_data,
                         dash::channel_t::settings, dash::channel_t::time_sync})
    {
        session.on_subscribe(peer, channel, true);
    }

    auto hash = dash::art_hash(FLAGS_artist, FLAGS_album);
    auto state = dash::empty_media_state();
    state.set_is_playing(true);
    state.set_playback_state("playing");
    state.set_track_title(FLAGS_title);
    state.set_artist(FLAGS_artist);
    state.set_album(FLAGS_album);
    state.set_duration(622000);
    state.set_position(1000);
    state.set_volume(60);
    state.set_album_art_hash(dash::hash_string(hash));
    session.notify_media_state(state);

    // subscribing to the state channel pushes the state and schedules the time sync
    session.on_subscribe(peer, dash::channel_t::media_state, true);
    session.notify_settings({{"lyricsEnabled", true}});
    session.notify_media_channels({"Spotify", "YouTube Music", "Podcasts"});

    if (!FLAGS_art.empty())
    {
        try
        {
            auto image = read_file(FLAGS_art);
            session.get_pool().commit_after(dash::make_timespan(0, FLAGS_prepare_ms),
                                            [&session, hash, image]() { session.publish_artwork(hash, image); });
        } catch (dash::dash_param_exception &e)
        {
            LOG(ERROR) << e.what();
        }
    }

    session.on_write(peer, dash::channel_t::art_request,
                     dash::buffer_t::from_string("{\"hash\":\"" + dash::hash_string(hash) + "\"}"));
    session.on_write(peer, dash::channel_t::playback_control,
                     dash::buffer_t::from_string("{\"action\":\"request_queue\"}"));
    session.on_write(peer, dash::channel_t::playback_control,
                     dash::buffer_t::from_string("{\"action\":\"volume\",\"value\":42}"));
    session.on_write(peer, dash::channel_t::playback_control, dash::buffer_t::from_string("{\"action\":"));

    std::this_thread::sleep_for(std::chrono::milliseconds(std::max(FLAGS_time_sync_ms, FLAGS_prepare_ms) + 500));
    session.get_pool().wait_idle();

    std::unique_lock<std::mutex> lock(view.mutex);
    std::cout << "media state: " << view.media_state << std::endl;
    std::cout << "time sync:   " << view.time_sync << std::endl;
    std::cout << "settings:    " << view.settings << std::endl;
    for (auto &it : view.responses)
    {
        std::cout << "response type " << it.first << ": " << it.second.get_length() << " bytes" << std::endl;
        if (it.first == dash::response_type::media_channels)
        {
            for (auto &name : dash::decode_media_channels(it.second))
                std::cout << "    " << name << std::endl;
        }
    }
    dash::u64 art_bytes = 0;
    for (auto &it : view.art)
    {
        art_bytes += it.second.data.get_length();
    }
    std::cout << "artwork:     " << view.art.size() << " chunks, " << art_bytes << " bytes, " << view.bad_crc
              << " bad crc" << std::endl;
    lock.unlock();

    session.on_disconnect(peer);
    session.shutdown();
    return 0;
}
