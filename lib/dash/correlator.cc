#include "dash/correlator.hpp"
#include <chrono>
#include <glog/logging.h>

namespace dash
{

correlator_t::correlator_t(art_transmitter_t &transmitter, microsecond_t deadline, art_lookup_t *lookup,
                           art_fetcher_t *fetcher)
    : transmitter(transmitter)
    , deadline(deadline)
    , lookup(lookup)
    , fetcher(fetcher)
{
}

bool correlator_t::current_matches(art_hash_t hash) const
{
    return current && !current->empty() && current->front().hash == hash;
}

std::shared_ptr<correlator_t::window_t> correlator_t::open_window(const peer_id_t &peer, art_hash_t hash)
{
    auto window = std::make_shared<window_t>();
    window->peer = peer;
    window->hash = hash;
    window->superseded = false;
    windows.push_back(window);
    return window;
}

void correlator_t::close_window(const std::shared_ptr<window_t> &window) { windows.remove(window); }

correlation_result correlator_t::send(const peer_id_t &peer, const art_chunks_t &chunks,
                                      correlation_result on_success)
{
    auto result = transmitter.transmit(peer, chunks);
    if (result != send_result::ok)
    {
        LOG(WARNING) << "artwork for " << peer << " not delivered: " << send_result_strings[result];
        return correlation_result::send_failed;
    }
    return on_success;
}

void correlator_t::set_expected(art_hash_t hash)
{
    std::unique_lock<std::mutex> lock(mutex);
    expected = hash;
    if (current && !current_matches(hash))
        current.reset();
}

void correlator_t::clear_expected()
{
    std::unique_lock<std::mutex> lock(mutex);
    expected.reset();
    current.reset();
}

void correlator_t::publish(art_hash_t hash, art_chunks_t chunks)
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        current = std::make_shared<const art_chunks_t>(std::move(chunks));
        VLOG(1) << "artwork " << hash << " ready, " << current->size() << " chunks";
    }
    cond.notify_all();
}

std::shared_ptr<const art_chunks_t> correlator_t::current_chunks()
{
    std::unique_lock<std::mutex> lock(mutex);
    return current;
}

std::optional<art_hash_t> correlator_t::expected_hash()
{
    std::unique_lock<std::mutex> lock(mutex);
    return expected;
}

correlation_result correlator_t::resolve(const peer_id_t &peer, art_hash_t hash)
{
    std::unique_lock<std::mutex> lock(mutex);
    if (current_matches(hash))
    {
        auto chunks = current;
        lock.unlock();
        LOG(INFO) << "artwork " << hash << " ready, sending to " << peer;
        return send(peer, *chunks, correlation_result::sent_ready);
    }

    auto window = open_window(peer, hash);
    if (expected && *expected == hash)
    {
        VLOG(1) << "artwork " << hash << " expected, waiting for it";
        auto until = std::chrono::steady_clock::now() + std::chrono::microseconds(deadline);
        bool woke = cond.wait_until(lock, until, [this, &window, hash]() {
            return window->superseded || current_matches(hash);
        });
        close_window(window);
        if (window->superseded)
            return correlation_result::superseded;
        if (!woke)
        {
            LOG(WARNING) << "artwork " << hash << " not ready within " << deadline / 1000 << "ms";
            return correlation_result::timed_out;
        }
        auto chunks = current;
        lock.unlock();
        return send(peer, *chunks, correlation_result::sent_after_wait);
    }

    // not the current track
    auto cache = lookup;
    auto fetch = fetcher;
    lock.unlock();

    std::optional<art_chunks_t> chunks;
    auto result = correlation_result::miss;
    if (cache)
    {
        chunks = cache->lookup(hash);
        result = correlation_result::sent_from_cache;
    }
    if ((!chunks || chunks->empty()) && fetch)
    {
        chunks = fetch->fetch(hash);
        result = correlation_result::sent_fetched;
    }

    lock.lock();
    close_window(window);
    if (window->superseded)
        return correlation_result::superseded;
    lock.unlock();

    if (!chunks || chunks->empty())
    {
        LOG(WARNING) << "no artwork available for hash " << hash;
        return correlation_result::miss;
    }
    return send(peer, *chunks, result);
}

void correlator_t::cancel_peer(const peer_id_t &peer)
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        for (auto &window : windows)
        {
            if (window->peer == peer)
                window->superseded = true;
        }
    }
    cond.notify_all();
}

void correlator_t::cancel_all()
{
    {
        std::unique_lock<std::mutex> lock(mutex);
        for (auto &window : windows)
        {
            window->superseded = true;
        }
    }
    cond.notify_all();
}

u64 correlator_t::pending()
{
    std::unique_lock<std::mutex> lock(mutex);
    return windows.size();
}

} // namespace dash
