#include "dash/art.hpp"
#include <boost/crc.hpp>
#include <chrono>
#include <glog/logging.h>
#include <string.h>

namespace dash
{

u32 crc32(const byte *data, u64 len)
{
    boost::crc_32_type crc;
    crc.process_bytes(data, len);
    return crc.checksum();
}

u32 crc32(const buffer_t &data) { return crc32(data.get(), data.get_length()); }

std::vector<art_chunk_t> prepare_chunks(art_hash_t hash, const buffer_t &image, u16 chunk_size)
{
    if (chunk_size == 0 || chunk_size > art_chunk_size)
        throw dash_param_exception("artwork chunk size out of range");

    u64 length = image.get_length();
    u64 total = (length + chunk_size - 1) / chunk_size;
    if (total > 0xFFFF)
        throw dash_param_exception("artwork too large for a 16 bits chunk count");

    std::vector<art_chunk_t> chunks;
    chunks.reserve(total);
    for (u64 i = 0; i < total; i++)
    {
        art_chunk_t chunk;
        chunk.hash = hash;
        chunk.index = i;
        chunk.total = total;
        // own copy, chunk lists are cached longer than the image
        auto slice = image.slice(i * chunk_size, chunk_size);
        chunk.data = buffer_t(slice.get(), slice.get_length());
        chunk.crc = crc32(chunk.data);
        chunks.emplace_back(std::move(chunk));
    }
    VLOG(1) << "prepared " << total << " artwork chunks for " << length << " bytes (hash " << hash << ")";
    return chunks;
}

buffer_t encode_art_chunk(const art_chunk_t &chunk)
{
    u64 length = chunk.data.get_length();
    if (length > art_chunk_size)
        throw dash_param_exception("artwork chunk body larger than the wire allows");

    art_chunk_header_t header;
    header.hash = chunk.hash;
    header.index = chunk.index;
    header.total = chunk.total;
    header.length = length;
    header.crc = chunk.crc;
    header.reserved = 0;

    buffer_t bytes(art_header_size + length);
    endian::save_to(header, bytes);
    if (length > 0)
        memcpy(bytes.get() + art_header_size, chunk.data.get(), length);
    return bytes;
}

std::optional<art_chunk_t> decode_art_chunk(const buffer_t &bytes)
{
    art_chunk_header_t header;
    if (!endian::cast_to(bytes, header))
        return {};
    if (bytes.get_length() < (u64)art_header_size + header.length)
        return {};

    art_chunk_t chunk;
    chunk.hash = header.hash;
    chunk.index = header.index;
    chunk.total = header.total;
    chunk.crc = header.crc;
    chunk.data = buffer_t(bytes.get() + art_header_size, header.length);
    return chunk;
}

ack_slot_t::ack_slot_t()
    : has_value(false)
    , value(false)
{
}

void ack_slot_t::put(bool success)
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        has_value = true;
        value = success;
    }
    cond.notify_one();
}

std::optional<bool> ack_slot_t::take(microsecond_t timeout)
{
    std::unique_lock<std::mutex> lock(mutex);
    if (!cond.wait_for(lock, std::chrono::microseconds(timeout), [this]() { return has_value; }))
        return {};
    has_value = false;
    return value;
}

void ack_slot_t::clear()
{
    std::unique_lock<std::mutex> lock(mutex);
    has_value = false;
}

art_transmitter_t::art_transmitter_t(peer_registry_t &registry, notifier_t &notifier, throttle_t &throttle,
                                     microsecond_t ack_timeout)
    : registry(registry)
    , notifier(notifier)
    , throttle(throttle)
    , ack_timeout(ack_timeout)
{
}

bool art_transmitter_t::still_active(const peer_id_t &peer, const std::shared_ptr<transfer_t> &transfer) const
{
    std::unique_lock<std::mutex> lock(mutex);
    auto it = transfers.find(peer);
    return it != transfers.end() && it->second == transfer;
}

std::shared_ptr<ack_slot_t> art_transmitter_t::get_ack_slot(const peer_id_t &peer)
{
    std::unique_lock<std::mutex> lock(mutex);
    auto &slot = acks[peer];
    if (!slot)
        slot = std::make_shared<ack_slot_t>();
    return slot;
}

send_result art_transmitter_t::transmit(const peer_id_t &peer, const std::vector<art_chunk_t> &chunks)
{
    if (!registry.is_connected(peer))
        return send_result::no_peer;

    auto transfer = std::make_shared<transfer_t>();
    transfer->hash = chunks.empty() ? 0 : chunks.front().hash;
    transfer->cursor = 0;
    transfer->total = chunks.size();
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (transfers.count(peer) != 0)
        {
            LOG(WARNING) << "artwork transfer already in progress for " << peer;
            return send_result::rejected;
        }
        transfers.emplace(peer, transfer);
    }

    auto ack = get_ack_slot(peer);
    ack->clear();

    LOG(INFO) << "artwork transfer of " << chunks.size() << " chunks (hash " << transfer->hash << ") to " << peer;
    send_result result = send_result::ok;
    try
    {
        for (auto &chunk : chunks)
        {
            if (!still_active(peer, transfer) || !registry.is_connected(peer))
            {
                LOG(INFO) << "artwork transfer to " << peer << " cancelled at chunk " << transfer->cursor + 1 << "/"
                          << transfer->total;
                result = send_result::cancelled;
                break;
            }

            throttle.throttle();
            auto bytes = encode_art_chunk(chunk);
            u64 index = transfer->cursor;
            if (index == 0 || index + 1 == transfer->total || (index + 1) % 50 == 0)
            {
                VLOG(1) << "artwork chunk " << index + 1 << "/" << transfer->total << ": " << bytes.get_length()
                        << " bytes (" << chunk.data.get_length() << " data)";
            }

            if (!notifier.notify(peer, channel_t::art_data, bytes))
            {
                LOG(ERROR) << "failed to send artwork chunk " << index + 1 << "/" << transfer->total << " to " << peer;
                result = send_result::failed;
                break;
            }
            transfer->cursor++;

            // pacing only. a lost ack must not stall the transfer
            if (!ack->take(ack_timeout))
                VLOG(2) << "no send completion for artwork chunk " << index + 1 << " to " << peer;
        }
    } catch (std::exception &e)
    {
        LOG(ERROR) << "artwork transfer to " << peer << " aborted: " << e.what();
        result = send_result::failed;
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        auto it = transfers.find(peer);
        if (it != transfers.end() && it->second == transfer)
            transfers.erase(it);
    }

    if (result == send_result::ok)
        LOG(INFO) << "artwork transfer complete, " << transfer->cursor << "/" << transfer->total << " chunks to "
                  << peer;
    return result;
}

void art_transmitter_t::cancel(const peer_id_t &peer)
{
    std::shared_ptr<ack_slot_t> slot;
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (transfers.erase(peer) == 0)
            return;
        auto it = acks.find(peer);
        if (it != acks.end())
            slot = it->second;
    }
    // wake the pacing wait so the loop sees the cancel now
    if (slot)
        slot->put(false);
    VLOG(1) << "cancelled artwork transfer for " << peer;
}

void art_transmitter_t::forget(const peer_id_t &peer)
{
    cancel(peer);
    std::unique_lock<std::mutex> lock(mutex);
    acks.erase(peer);
}

u64 art_transmitter_t::tracked_peers() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return acks.size();
}

bool art_transmitter_t::is_active(const peer_id_t &peer) const
{
    std::unique_lock<std::mutex> lock(mutex);
    return transfers.count(peer) != 0;
}

void art_transmitter_t::on_notification_sent(const peer_id_t &peer, int status)
{
    std::shared_ptr<ack_slot_t> slot;
    {
        std::unique_lock<std::mutex> lock(mutex);
        auto it = acks.find(peer);
        if (it == acks.end())
            return;
        slot = it->second;
    }
    slot->put(status == 0);
}

} // namespace dash
