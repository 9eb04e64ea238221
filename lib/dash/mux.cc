#include "dash/mux.hpp"
#include <algorithm>
#include <glog/logging.h>
#include <string.h>

namespace dash
{

std::vector<buffer_t> split_payload(const buffer_t &payload, u64 capacity)
{
    if (capacity == 0)
        throw dash_param_exception("fragment capacity must be positive");

    std::vector<buffer_t> slices;
    u64 length = payload.get_length();
    if (length == 0)
    {
        slices.emplace_back(payload.slice(0, 0));
        return slices;
    }
    slices.reserve((length + capacity - 1) / capacity);
    for (u64 offset = 0; offset < length; offset += capacity)
    {
        slices.emplace_back(payload.slice(offset, capacity));
    }
    return slices;
}

buffer_t encode_fragment(u8 type, u64 index, u64 total, const buffer_t &body)
{
    mux_header_t header;
    header.type = type;
    header.index = (u8)index;
    header.total = (u8)total;

    buffer_t fragment(sizeof(header) + body.get_length());
    endian::save_to(header, fragment);
    if (body.get_length() > 0)
        memcpy(fragment.get() + sizeof(header), body.get(), body.get_length());
    return fragment;
}

multiplexer_t::multiplexer_t(peer_registry_t &registry, notifier_t &notifier, throttle_t &throttle,
                             u16 max_packet)
    : registry(registry)
    , notifier(notifier)
    , throttle(throttle)
    , max_packet(max_packet)
{
    if (max_packet <= mux_header_size)
        throw dash_param_exception("max packet must be larger than the fragment header");
}

u64 multiplexer_t::fragment_capacity(const peer_id_t &peer) const
{
    u64 ceiling = std::min<u64>(max_packet, registry.negotiated_payload(peer));
    if (ceiling <= mux_header_size)
        throw dash_param_exception("negotiated payload too small for the fragment header");
    return ceiling - mux_header_size;
}

u64 multiplexer_t::send(u8 type, const buffer_t &payload)
{
    auto peers = registry.subscribers(channel_t::podcast_info);
    u64 delivered = 0;
    for (auto &peer : peers)
    {
        if (send_to(peer, type, payload) == send_result::ok)
            delivered++;
    }
    VLOG(1) << "response type " << (int)type << ", " << payload.get_length() << " bytes delivered to " << delivered
            << "/" << peers.size() << " peers";
    return delivered;
}

send_result multiplexer_t::send_to(const peer_id_t &peer, u8 type, const buffer_t &payload)
{
    if (!registry.is_connected(peer))
        return send_result::no_peer;
    return send_tagged_to(peer, channel_t::podcast_info, type, payload, fragment_capacity(peer));
}

send_result multiplexer_t::send_tagged_to(const peer_id_t &peer, channel_t channel, u8 tag,
                                          const buffer_t &payload, u64 capacity)
{
    auto slices = split_payload(payload, capacity);
    if (slices.size() > 0xFF)
    {
        LOG(WARNING) << "payload of " << payload.get_length() << " bytes needs " << slices.size()
                     << " fragments, index wraps at 256";
    }

    for (u64 i = 0; i < slices.size(); i++)
    {
        if (!registry.is_connected(peer))
        {
            VLOG(1) << "peer " << peer << " gone after " << i << "/" << slices.size() << " fragments";
            return i == 0 ? send_result::no_peer : send_result::cancelled;
        }
        throttle.throttle();
        if (!notifier.notify(peer, channel, encode_fragment(tag, i, slices.size(), slices[i])))
        {
            LOG(WARNING) << "failed to notify fragment " << i + 1 << "/" << slices.size() << " (tag " << (int)tag
                         << ") on " << channel_name(channel) << " to " << peer;
            return send_result::failed;
        }
    }
    return send_result::ok;
}

u64 multiplexer_t::send_untagged(channel_t channel, const buffer_t &payload)
{
    auto peers = registry.subscribers(channel);
    u64 delivered = 0;
    for (auto &peer : peers)
    {
        if (send_untagged_to(peer, channel, payload) == send_result::ok)
            delivered++;
    }
    return delivered;
}

send_result multiplexer_t::send_untagged_to(const peer_id_t &peer, channel_t channel, const buffer_t &payload)
{
    if (!registry.is_connected(peer))
        return send_result::no_peer;
    throttle.throttle();
    if (!notifier.notify(peer, channel, payload))
    {
        LOG(WARNING) << "failed to notify " << payload.get_length() << " bytes on " << channel_name(channel) << " to "
                     << peer;
        return send_result::failed;
    }
    return send_result::ok;
}

std::optional<mux_message_t> mux_decoder_t::feed(const buffer_t &fragment)
{
    mux_header_t header;
    if (!endian::cast_to(fragment, header))
        throw dash_protocol_exception("fragment shorter than its header", protocol_error::truncated);

    auto body = fragment.slice(sizeof(header), fragment.get_length());
    if (header.index == 0)
    {
        partials[header.type] = partial_t{header.total, 0, {}};
    }
    auto it = partials.find(header.type);
    if (it == partials.end())
        return {};

    auto &partial = it->second;
    if (partial.total != header.total || partial.next != header.index)
    {
        // lost or reordered fragment, wait for a fresh index 0
        partials.erase(it);
        return {};
    }
    auto bytes = body.to_vector();
    partial.data.insert(partial.data.end(), bytes.begin(), bytes.end());
    partial.next++;

    if (partial.next != partial.total)
        return {};

    mux_message_t message{header.type, buffer_t::from_vector(partial.data)};
    partials.erase(it);
    return message;
}

} // namespace dash
