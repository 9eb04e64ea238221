#include "dash/mux.hpp"
#include "dash/test_helper.hpp"
#include <gtest/gtest.h>

using namespace dash;

namespace
{
struct mux_fixture_t
{
    test::manual_time_source_t source;
    peer_registry_t registry;
    loopback_notifier_t notifier;
    throttle_t throttle;
    multiplexer_t mux;

    mux_fixture_t()
        : throttle(source, make_timespan(0, 10))
        , mux(registry, notifier, throttle)
    {
    }

    void add_peer(const peer_id_t &peer, u16 mtu)
    {
        registry.on_connect(peer);
        registry.negotiate_mtu(peer, mtu);
        registry.set_subscribed(peer, channel_t::podcast_info, true);
    }
};
} // namespace

TEST(MuxTest, QueueResponseFragments)
{
    mux_fixture_t f;
    f.add_peer("a", 517);
    auto payload = test::make_bytes(1200);
    GTEST_ASSERT_EQ(f.mux.fragment_capacity("a"), 500u);
    GTEST_ASSERT_EQ(f.mux.send(response_type::playback_queue, payload), 1u);

    auto records = f.notifier.get_records("a", channel_t::podcast_info);
    GTEST_ASSERT_EQ(records.size(), 3u);
    u64 lengths[] = {500, 500, 200};
    u64 offset = 0;
    for (u64 i = 0; i < 3; i++)
    {
        auto &data = records[i].data;
        GTEST_ASSERT_EQ(data.size(), lengths[i] + 3);
        GTEST_ASSERT_EQ(data[0], 6);
        GTEST_ASSERT_EQ(data[1], i);
        GTEST_ASSERT_EQ(data[2], 3);
        GTEST_ASSERT_EQ(data[3], payload.get()[offset]);
        offset += lengths[i];
    }
}

TEST(MuxTest, EmptyPayload)
{
    mux_fixture_t f;
    f.add_peer("a", 517);
    GTEST_ASSERT_EQ(f.mux.send_to("a", response_type::podcast_list, buffer_t()), send_result::ok);
    auto records = f.notifier.get_records();
    GTEST_ASSERT_EQ(records.size(), 1u);
    GTEST_ASSERT_EQ(records[0].data.size(), 3u);
    GTEST_ASSERT_EQ(records[0].data[0], 1);
    GTEST_ASSERT_EQ(records[0].data[1], 0);
    GTEST_ASSERT_EQ(records[0].data[2], 1);
}

TEST(MuxTest, FragmentCountFollowsMtu)
{
    u16 mtus[] = {23, 100, 185, 247, 517};
    for (auto mtu : mtus)
    {
        mux_fixture_t f;
        f.add_peer("a", mtu);
        u64 capacity = std::min<u64>(503, mtu - 3) - 3;
        GTEST_ASSERT_EQ(f.mux.fragment_capacity("a"), capacity);
        u64 len = 2000;
        f.mux.send_to("a", response_type::track_list, test::make_bytes(len));
        auto records = f.notifier.get_records();
        GTEST_ASSERT_EQ(records.size(), (len + capacity - 1) / capacity);
        for (auto &record : records)
        {
            GTEST_ASSERT_LE(record.data.size(), capacity + 3);
            GTEST_ASSERT_EQ(record.data[2], records.size());
        }
    }
}

TEST(MuxTest, PeersAreIndependent)
{
    mux_fixture_t f;
    f.add_peer("a", 517);
    f.add_peer("b", 517);
    f.notifier.fail_at("a", 1);
    GTEST_ASSERT_EQ(f.mux.send(response_type::album_list, test::make_bytes(1200)), 1u);
    GTEST_ASSERT_EQ(f.notifier.get_records("a", channel_t::podcast_info).size(), 1u);
    GTEST_ASSERT_EQ(f.notifier.get_records("b", channel_t::podcast_info).size(), 3u);
}

TEST(MuxTest, UnknownPeer)
{
    mux_fixture_t f;
    GTEST_ASSERT_EQ(f.mux.send_to("x", response_type::playback_state, test::make_bytes(10)), send_result::no_peer);
    GTEST_ASSERT_EQ(f.mux.send(response_type::playback_state, test::make_bytes(10)), 0u);
    GTEST_ASSERT_EQ(f.notifier.count(), 0u);
}

TEST(MuxTest, RefusedFragment)
{
    mux_fixture_t f;
    f.add_peer("a", 517);
    f.notifier.refuse(true);
    GTEST_ASSERT_EQ(f.mux.send_to("a", response_type::artist_list, test::make_bytes(10)), send_result::failed);
}

TEST(MuxTest, DecoderRoundTrip)
{
    mux_fixture_t f;
    f.add_peer("a", 185);
    auto payload = test::make_bytes(3000, 7);
    f.mux.send_to("a", response_type::library_overview, payload);

    mux_decoder_t decoder;
    std::optional<mux_message_t> message;
    for (auto &record : f.notifier.get_records())
    {
        GTEST_ASSERT_EQ(message.has_value(), false);
        message = decoder.feed(buffer_t::from_vector(record.data));
    }
    GTEST_ASSERT_EQ(message.has_value(), true);
    GTEST_ASSERT_EQ(message->type, response_type::library_overview);
    GTEST_ASSERT_EQ(message->payload.to_vector(), payload.to_vector());
    GTEST_ASSERT_EQ(decoder.pending(), 0u);
}

TEST(MuxTest, DecoderDropsGap)
{
    mux_decoder_t decoder;
    auto body = test::make_bytes(4);
    GTEST_ASSERT_EQ(decoder.feed(encode_fragment(2, 0, 3, body)).has_value(), false);
    GTEST_ASSERT_EQ(decoder.pending(), 1u);
    GTEST_ASSERT_EQ(decoder.feed(encode_fragment(2, 2, 3, body)).has_value(), false);
    GTEST_ASSERT_EQ(decoder.pending(), 0u);

    // a fresh index 0 restarts the payload
    decoder.feed(encode_fragment(2, 0, 2, body));
    auto message = decoder.feed(encode_fragment(2, 1, 2, body));
    GTEST_ASSERT_EQ(message.has_value(), true);
    GTEST_ASSERT_EQ(message->payload.get_length(), 8u);

    EXPECT_THROW(decoder.feed(test::make_bytes(2)), dash_protocol_exception);
}

TEST(MuxTest, IndexWrapsAtOneByte)
{
    mux_fixture_t f;
    f.add_peer("a", default_mtu);
    u64 capacity = f.mux.fragment_capacity("a");
    GTEST_ASSERT_EQ(capacity, 17u);
    GTEST_ASSERT_EQ(f.mux.send_to("a", response_type::track_list, test::make_bytes(300 * capacity)),
                    send_result::ok);

    auto records = f.notifier.get_records();
    GTEST_ASSERT_EQ(records.size(), 300u);
    GTEST_ASSERT_EQ(records[0].data[2], 44);
    GTEST_ASSERT_EQ(records[255].data[1], 255);
    GTEST_ASSERT_EQ(records[256].data[1], 0);
}

TEST(MuxTest, UntaggedBroadcast)
{
    mux_fixture_t f;
    f.registry.on_connect("a");
    f.registry.on_connect("b");
    f.registry.set_subscribed("a", channel_t::settings, true);
    GTEST_ASSERT_EQ(f.mux.send_untagged(channel_t::settings, buffer_t::from_string("{}")), 1u);
    auto records = f.notifier.get_records();
    GTEST_ASSERT_EQ(records.size(), 1u);
    GTEST_ASSERT_EQ(records[0].peer, "a");
    GTEST_ASSERT_EQ(records[0].data.size(), 2u);
}

TEST(MuxTest, FragmentsArePaced)
{
    mux_fixture_t f;
    f.add_peer("a", 517);
    auto start = f.source.now();
    f.mux.send_to("a", response_type::playback_queue, test::make_bytes(1200));
    GTEST_ASSERT_EQ(f.source.now() - start, 2 * make_timespan(0, 10));
}
