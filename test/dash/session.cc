#include "dash/session.hpp"
#include "dash/test_helper.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <thread>

using namespace dash;

namespace
{
session_config_t fast_config()
{
    session_config_t config;
    config.ack_timeout = make_timespan(0, 1);
    config.correlation_deadline = make_timespan(0, 200);
    config.time_sync_delay = make_timespan(0, 20);
    config.request_indicator_hold = make_timespan(0, 50);
    config.threads = 2;
    return config;
}

struct session_fixture_t
{
    test::manual_time_source_t source;
    loopback_notifier_t notifier;
    transport_session_t session;

    session_fixture_t()
        : session(notifier, fast_config(), source)
    {
    }

    void add_peer(const peer_id_t &peer, std::initializer_list<channel_t> channels)
    {
        session.on_connect(peer);
        session.on_mtu_changed(peer, 517);
        for (auto channel : channels)
            session.on_subscribe(peer, channel, true);
    }

    void write(const peer_id_t &peer, channel_t channel, const std::string &json)
    {
        session.on_write(peer, channel, buffer_t::from_string(json));
        session.get_pool().wait_idle();
    }

    std::vector<mux_message_t> responses(const peer_id_t &peer)
    {
        mux_decoder_t decoder;
        std::vector<mux_message_t> messages;
        for (auto &record : notifier.get_records(peer, channel_t::podcast_info))
        {
            auto message = decoder.feed(buffer_t::from_vector(record.data));
            if (message)
                messages.push_back(*message);
        }
        return messages;
    }
};

class queue_producer_t : public payload_producer_t
{
  public:
    int calls = 0;
    std::optional<payload_t> produce(const command_t &command) override
    {
        calls++;
        proto::QueueResponse queue;
        queue.set_s("spotify");
        for (int i = 0; i < 30; i++)
        {
            auto track = queue.add_q();
            track->set_t("Track " + std::to_string(i));
            track->set_a("Artist");
            track->set_d(180);
            track->set_u("spotify:track:" + std::to_string(i));
        }
        return payload_t{response_type::playback_queue, to_buffer(queue)};
    }
};

proto::MediaState playing_state(art_hash_t hash)
{
    auto state = empty_media_state();
    state.set_is_playing(true);
    state.set_playback_state("playing");
    state.set_track_title("Song");
    state.set_artist("Artist");
    state.set_album("Album");
    state.set_album_art_hash(hash_string(hash));
    return state;
}

} // namespace

TEST(SessionTest, InitialStateOnSubscribe)
{
    session_fixture_t f;
    GTEST_ASSERT_EQ(f.session.notify_media_state(playing_state(5)), 0u);
    f.add_peer("a", {channel_t::time_sync, channel_t::media_state});

    auto states = f.notifier.get_records("a", channel_t::media_state);
    GTEST_ASSERT_EQ(states.size(), 1u);
    proto::MediaState state;
    decode_json(std::string(states[0].data.begin(), states[0].data.end()), state);
    GTEST_ASSERT_EQ(state.track_title(), "Song");
    GTEST_ASSERT_EQ(state.album_art_hash(), "5");

    // the time sync goes out after a delay, poll for it
    for (int i = 0; i < 400 && f.notifier.get_records("a", channel_t::time_sync).empty(); i++)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    f.session.get_pool().wait_idle();
    auto syncs = f.notifier.get_records("a", channel_t::time_sync);
    GTEST_ASSERT_EQ(syncs.size(), 1u);
    std::string text(syncs[0].data.begin(), syncs[0].data.end());
    GTEST_ASSERT_EQ(std::count(text.begin(), text.end(), '|'), 2);
}

TEST(SessionTest, StateBroadcast)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::media_state});
    f.add_peer("b", {channel_t::media_state});
    GTEST_ASSERT_EQ(f.session.notify_media_state(playing_state(5)), 2u);
    GTEST_ASSERT_EQ(*f.session.get_correlator().expected_hash(), 5u);
}

TEST(SessionTest, ReadMediaState)
{
    session_fixture_t f;
    proto::MediaState state;
    decode_json(f.session.read_media_state(0).to_string(), state);
    GTEST_ASSERT_EQ(state.playback_state(), "stopped");

    f.session.notify_media_state(playing_state(5));
    auto full = f.session.read_media_state(0).to_string();
    GTEST_ASSERT_EQ(f.session.read_media_state(10).to_string(), full.substr(10));
    GTEST_ASSERT_EQ(f.session.read_media_state(full.size()).get_length(), 0u);
    GTEST_ASSERT_EQ(f.session.read_media_state(full.size() + 100).get_length(), 0u);
}

TEST(SessionTest, ArtRequestOnWrite)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::art_data});
    f.add_peer("b", {channel_t::art_data});
    auto hash = art_hash("Artist", "Album");
    f.session.notify_media_state(playing_state(hash));
    f.session.publish_artwork(hash, test::make_bytes(2000));

    f.write("a", channel_t::art_request, R"({"hash":")" + hash_string(hash) + "\"}");
    auto records = f.notifier.get_records("a", channel_t::art_data);
    GTEST_ASSERT_EQ(records.size(), 5u);
    auto chunk = decode_art_chunk(buffer_t::from_vector(records[4].data));
    GTEST_ASSERT_EQ(chunk->hash, hash);
    GTEST_ASSERT_EQ(chunk->total, 5);
    GTEST_ASSERT_EQ(chunk->data.get_length(), 2000u - 4 * 496);
    // only the requester gets the artwork
    GTEST_ASSERT_EQ(f.notifier.get_records("b", channel_t::art_data).size(), 0u);
    GTEST_ASSERT_EQ(f.session.last_art_request(), hash);
}

TEST(SessionTest, ArtWaitsForExpected)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::art_data});
    f.session.notify_media_state(playing_state(77));
    f.session.on_write("a", channel_t::art_request, buffer_t::from_string(R"({"hash":"77"})"));
    while (f.session.get_correlator().pending() == 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    f.session.publish_artwork(77, test::make_bytes(600));
    f.session.get_pool().wait_idle();
    GTEST_ASSERT_EQ(f.notifier.get_records("a", channel_t::art_data).size(), 2u);
}

TEST(SessionTest, ArtFromCache)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::art_data});
    f.session.cache_artwork(8, test::make_bytes(100));
    GTEST_ASSERT_EQ(f.session.request_artwork("a", 8), correlation_result::sent_from_cache);
    GTEST_ASSERT_EQ(f.session.request_artwork("a", 9), correlation_result::miss);
    GTEST_ASSERT_EQ(f.notifier.get_records("a", channel_t::art_data).size(), 1u);
}

TEST(SessionTest, HashlessStateClearsExpected)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::art_data});
    f.session.notify_media_state(playing_state(11));
    f.session.publish_artwork(11, test::make_bytes(1000));
    GTEST_ASSERT_EQ(*f.session.get_correlator().expected_hash(), 11u);

    auto state = empty_media_state();
    state.set_track_title("Radio stream");
    f.session.notify_media_state(state);
    GTEST_ASSERT_EQ(f.session.get_correlator().expected_hash().has_value(), false);
    GTEST_ASSERT_EQ(f.session.get_correlator().current_chunks() == nullptr, true);

    // the previous track's artwork comes from the library cache, no wait
    f.session.cache_artwork(11, test::make_bytes(100));
    GTEST_ASSERT_EQ(f.session.request_artwork("a", 11), correlation_result::sent_from_cache);
    GTEST_ASSERT_EQ(f.notifier.get_records("a", channel_t::art_data).size(), 1u);
}

TEST(SessionTest, MalformedHashClearsExpected)
{
    session_fixture_t f;
    f.session.notify_media_state(playing_state(11));
    auto state = playing_state(11);
    state.set_album_art_hash("not a hash");
    f.session.notify_media_state(state);
    GTEST_ASSERT_EQ(f.session.get_correlator().expected_hash().has_value(), false);
}

TEST(SessionTest, DisconnectDropsArtState)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::art_data});
    f.add_peer("b", {channel_t::art_data});
    f.session.cache_artwork(8, test::make_bytes(600));
    GTEST_ASSERT_EQ(f.session.request_artwork("a", 8), correlation_result::sent_from_cache);
    GTEST_ASSERT_EQ(f.session.request_artwork("b", 8), correlation_result::sent_from_cache);
    GTEST_ASSERT_EQ(f.session.get_transmitter().tracked_peers(), 2u);

    f.session.on_disconnect("a");
    GTEST_ASSERT_EQ(f.session.get_transmitter().tracked_peers(), 1u);
    f.session.shutdown();
    GTEST_ASSERT_EQ(f.session.get_transmitter().tracked_peers(), 0u);
}

TEST(SessionTest, RefusedArtworkIsNotReportedSent)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::art_data});
    f.session.cache_artwork(8, test::make_bytes(600));
    f.notifier.refuse(true);
    GTEST_ASSERT_EQ(f.session.request_artwork("a", 8), correlation_result::send_failed);
    f.notifier.refuse(false);
    GTEST_ASSERT_EQ(f.notifier.get_records("a", channel_t::art_data).size(), 0u);
}

TEST(SessionTest, RequestIndicator)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::art_data});
    f.session.request_artwork("a", 99);
    GTEST_ASSERT_EQ(f.session.art_request_active(), true);
    GTEST_ASSERT_EQ(f.session.last_art_request(), 99u);
    for (int i = 0; i < 400 && f.session.art_request_active(); i++)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    f.session.get_pool().wait_idle();
    GTEST_ASSERT_EQ(f.session.art_request_active(), false);
}

TEST(SessionTest, ProducerResponse)
{
    session_fixture_t f;
    queue_producer_t producer;
    f.session.register_producer(action_t::request_queue, &producer);
    f.add_peer("a", {channel_t::podcast_info});

    f.write("a", channel_t::playback_control, R"({"action":"request_queue"})");
    GTEST_ASSERT_EQ(producer.calls, 1);
    auto messages = f.responses("a");
    GTEST_ASSERT_EQ(messages.size(), 1u);
    GTEST_ASSERT_EQ(messages[0].type, response_type::playback_queue);
    proto::QueueResponse queue;
    decode_json(messages[0].payload.to_string(), queue);
    GTEST_ASSERT_EQ(queue.q_size(), 30);
    GTEST_ASSERT_GT(f.notifier.get_records("a", channel_t::podcast_info).size(), 1u);
}

TEST(SessionTest, CommandHandler)
{
    session_fixture_t f;
    queue_producer_t producer;
    std::vector<std::string> seen;
    f.session.register_producer(action_t::request_podcast_info, &producer)
        .on_command([&seen](transport_session_t &, const peer_id_t &, const command_t &command) {
            seen.push_back(command.name + ":" + std::to_string(command.value));
        });
    f.add_peer("a", {channel_t::podcast_info});

    f.write("a", channel_t::playback_control, R"({"action":"volume","value":30})");
    f.write("a", channel_t::playback_control, R"({"action":"request_podcast_info"})");
    f.write("a", channel_t::playback_control, R"({"action":)");
    GTEST_ASSERT_EQ(seen.size(), 1u);
    GTEST_ASSERT_EQ(seen[0], "volume:30");
    GTEST_ASSERT_EQ(producer.calls, 1);
    GTEST_ASSERT_EQ(f.session.get_dispatcher().get_dropped(), 1u);
}

TEST(SessionTest, Lyrics)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::lyrics_data});
    std::vector<lyrics_line_t> lines;
    for (int i = 0; i < 45; i++)
        lines.push_back(lyrics_line_t{i * 1500, "a lyrics line long enough to need more packets " + std::to_string(i)});
    GTEST_ASSERT_EQ(f.session.notify_lyrics("12", true, lines), 1u);

    auto records = f.notifier.get_records("a", channel_t::lyrics_data);
    mux_decoder_t decoder;
    std::vector<proto::LyricsChunk> chunks;
    for (auto &record : records)
    {
        GTEST_ASSERT_LE(record.data.size(), 503u);
        auto message = decoder.feed(buffer_t::from_vector(record.data));
        if (message)
        {
            proto::LyricsChunk chunk;
            decode_json(message->payload.to_string(), chunk);
            GTEST_ASSERT_EQ(message->type, chunk.c());
            chunks.push_back(chunk);
        }
    }
    GTEST_ASSERT_GT(records.size(), 3u);
    GTEST_ASSERT_EQ(chunks.size(), 3u);
    GTEST_ASSERT_EQ(chunks[2].l_size(), 5);
    GTEST_ASSERT_EQ(chunks[0].n(), 45);
    GTEST_ASSERT_EQ(chunks[1].m(), 3);
}

TEST(SessionTest, LyricsClearRequest)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::lyrics_data});
    f.write("a", channel_t::lyrics_request, R"({"action":"clear","hash":"5"})");
    auto records = f.notifier.get_records("a", channel_t::lyrics_data);
    GTEST_ASSERT_EQ(records.size(), 1u);
    proto::LyricsChunk chunk;
    decode_json(std::string(records[0].data.begin(), records[0].data.end()), chunk);
    GTEST_ASSERT_EQ(chunk.h(), "5");
    GTEST_ASSERT_EQ(chunk.m(), 1);
    GTEST_ASSERT_EQ(chunk.l_size(), 0);
}

TEST(SessionTest, LyricsHandler)
{
    session_fixture_t f;
    std::optional<lyrics_request_t> got;
    f.session.on_lyrics_request(
        [&got](transport_session_t &, const peer_id_t &, const lyrics_request_t &request) { got = request; });
    f.add_peer("a", {channel_t::lyrics_data});
    f.write("a", channel_t::lyrics_request, R"({"action":"get","artist":"A","track":"T"})");
    GTEST_ASSERT_EQ(got.has_value(), true);
    GTEST_ASSERT_EQ(*got->track, "T");
}

TEST(SessionTest, Responses)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::podcast_info, channel_t::settings});
    GTEST_ASSERT_EQ(f.session.notify_media_channels({"Spotify", "Podcasts"}), 1u);
    GTEST_ASSERT_EQ(f.session.notify_connection_status({{"spotify", "connected"}}), 1u);
    GTEST_ASSERT_EQ(f.session.notify_settings({{"lyricsEnabled", true}}), 1u);

    auto messages = f.responses("a");
    GTEST_ASSERT_EQ(messages.size(), 2u);
    GTEST_ASSERT_EQ(messages[0].type, response_type::media_channels);
    GTEST_ASSERT_EQ(decode_media_channels(messages[0].payload)[1], "Podcasts");
    GTEST_ASSERT_EQ(messages[1].type, response_type::connection_status);
    proto::ConnectionStatus status;
    decode_json(messages[1].payload.to_string(), status);
    GTEST_ASSERT_EQ(status.services().at("spotify"), "connected");
    GTEST_ASSERT_GT(status.timestamp(), 1600000000u);

    auto settings = f.notifier.get_records("a", channel_t::settings);
    GTEST_ASSERT_EQ(settings.size(), 1u);
}

TEST(SessionTest, DisconnectAndShutdown)
{
    session_fixture_t f;
    f.add_peer("a", {channel_t::settings});
    f.add_peer("b", {channel_t::settings});
    f.session.on_disconnect("a");
    GTEST_ASSERT_EQ(f.session.notify_settings({{"x", 1.0}}), 1u);
    f.session.on_subscribe("a", channel_t::settings, true);
    GTEST_ASSERT_EQ(f.session.get_registry().is_connected("a"), false);

    f.session.shutdown();
    GTEST_ASSERT_EQ(f.session.get_registry().count(), 0u);
    GTEST_ASSERT_EQ(f.session.notify_settings({{"x", 1.0}}), 0u);
}

TEST(SessionTest, IndependentSessions)
{
    loopback_notifier_t first_notifier, second_notifier;
    transport_session_t first(first_notifier, fast_config());
    transport_session_t second(second_notifier, fast_config());
    first.on_connect("a");
    second.on_connect("a");
    first.on_subscribe("a", channel_t::settings, true);
    second.on_subscribe("a", channel_t::settings, true);

    GTEST_ASSERT_EQ(first.notify_settings({{"theme", std::string("dark")}}), 1u);
    GTEST_ASSERT_EQ(first_notifier.count(), 1u);
    GTEST_ASSERT_EQ(second_notifier.count(), 0u);
    second.shutdown();
    GTEST_ASSERT_EQ(first.get_registry().is_connected("a"), true);
}
