#include "dash/registry.hpp"
#include <glog/logging.h>
#include <mutex>

namespace dash
{

peer_registry_t::peer_registry_t(u16 initial_mtu, u16 overhead)
    : initial_mtu(initial_mtu)
    , overhead(overhead)
{
}

void peer_registry_t::on_connect(const peer_id_t &peer)
{
    u64 total;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        if (peers.count(peer) != 0)
            return;
        peers.emplace(peer, std::make_unique<peer_info_t>(peer, initial_mtu));
        total = peers.size();
    }
    LOG(INFO) << "peer " << peer << " connected, total " << total;
}

void peer_registry_t::on_disconnect(const peer_id_t &peer)
{
    u64 rest;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        if (peers.erase(peer) == 0)
            return;
        rest = peers.size();
    }
    LOG(INFO) << "peer " << peer << " disconnected";
    if (disconnect_handler)
        disconnect_handler(*this, peer);
    if (rest == 0)
        LOG(INFO) << "no peer connected, advertising";
}

bool peer_registry_t::set_subscribed(const peer_id_t &peer, channel_t channel, bool enabled)
{
    bool newly_primary = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto it = peers.find(peer);
        if (it == peers.end())
            return false;
        auto &info = *it->second;
        u32 bit = 1u << (u32)channel;
        if (enabled)
        {
            newly_primary = channel == channel_t::media_state && !info.subscribed(channel);
            info.subscriptions |= bit;
        }
        else
        {
            info.subscriptions &= ~bit;
        }
    }
    VLOG(1) << "peer " << peer << (enabled ? " subscribed to " : " unsubscribed from ") << channel_name(channel);
    if (newly_primary && primary_subscribe_handler)
        primary_subscribe_handler(*this, peer);
    return true;
}

bool peer_registry_t::negotiate_mtu(const peer_id_t &peer, u16 mtu)
{
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = peers.find(peer);
    if (it == peers.end())
        return false;
    it->second->mtu = mtu;
    VLOG(1) << "peer " << peer << " mtu " << mtu;
    return true;
}

u16 peer_registry_t::negotiated_payload(const peer_id_t &peer) const
{
    u16 floor = initial_mtu > overhead ? initial_mtu - overhead : 0;
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = peers.find(peer);
    if (it == peers.end())
        return floor;
    u16 mtu = it->second->mtu;
    if (mtu <= overhead || mtu - overhead < floor)
        return floor;
    return mtu - overhead;
}

bool peer_registry_t::is_connected(const peer_id_t &peer) const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    return peers.count(peer) != 0;
}

bool peer_registry_t::is_subscribed(const peer_id_t &peer, channel_t channel) const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = peers.find(peer);
    if (it == peers.end())
        return false;
    return it->second->subscribed(channel);
}

std::vector<peer_id_t> peer_registry_t::subscribers(channel_t channel) const
{
    std::vector<peer_id_t> result;
    std::shared_lock<std::shared_mutex> lock(mutex);
    for (auto &it : peers)
    {
        if (it.second->subscribed(channel))
            result.push_back(it.first);
    }
    return result;
}

std::vector<peer_id_t> peer_registry_t::connected_peers() const
{
    std::vector<peer_id_t> result;
    std::shared_lock<std::shared_mutex> lock(mutex);
    result.reserve(peers.size());
    for (auto &it : peers)
    {
        result.push_back(it.first);
    }
    return result;
}

u64 peer_registry_t::count() const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    return peers.size();
}

void peer_registry_t::clear()
{
    std::unique_lock<std::shared_mutex> lock(mutex);
    peers.clear();
}

peer_registry_t &peer_registry_t::on_peer_disconnect(peer_disconnect_t handler)
{
    disconnect_handler = handler;
    return *this;
}

peer_registry_t &peer_registry_t::on_primary_subscribe(primary_subscribe_t handler)
{
    primary_subscribe_handler = handler;
    return *this;
}

} // namespace dash
