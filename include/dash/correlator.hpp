/**
* \file correlator.hpp
* \author DashLink developers
* \brief Resolve hash addressed artwork requests. The current track's artwork is either ready, expected soon, or
* the request is for something else which is looked up in a cache and fetched on demand.
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
#include "timer.hpp"
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <optional>

namespace dash
{

/// secondary cache of prepared artwork, keyed by hash
class art_lookup_t
{
  public:
    virtual std::optional<art_chunks_t> lookup(art_hash_t hash) = 0;
    virtual ~art_lookup_t(){};
};

/// one shot fetch and chunk of artwork not prepared yet
class art_fetcher_t
{
  public:
    virtual std::optional<art_chunks_t> fetch(art_hash_t hash) = 0;
    virtual ~art_fetcher_t(){};
};

enum class correlation_result
{
    /// current artwork was ready
    sent_ready,
    /// current artwork became ready before the deadline
    sent_after_wait,
    /// current artwork still missing at the deadline, nothing sent
    timed_out,
    sent_from_cache,
    sent_fetched,
    /// nothing known about the hash, nothing sent
    miss,
    /// requesting peer disconnected while the window was open
    superseded,
    /// artwork was found but the transmitter refused or aborted the transfer
    send_failed,
};

static const char *correlation_result_strings[] = {"sent ready",   "sent after wait", "timed out",  "sent from cache",
                                                   "sent fetched", "miss",            "superseded", "send failed"};

class correlator_t
{
    struct window_t
    {
        peer_id_t peer;
        art_hash_t hash;
        bool superseded;
    };

    art_transmitter_t &transmitter;
    microsecond_t deadline;
    art_lookup_t *lookup;
    art_fetcher_t *fetcher;

    std::mutex mutex;
    std::condition_variable cond;
    std::optional<art_hash_t> expected;
    std::shared_ptr<const art_chunks_t> current;
    std::list<std::shared_ptr<window_t>> windows;

    bool current_matches(art_hash_t hash) const;
    std::shared_ptr<window_t> open_window(const peer_id_t &peer, art_hash_t hash);
    void close_window(const std::shared_ptr<window_t> &window);
    correlation_result send(const peer_id_t &peer, const art_chunks_t &chunks, correlation_result on_success);

  public:
    ///\param deadline how long a request for the expected artwork waits for it
    ///\param lookup secondary cache, may be null
    ///\param fetcher on demand fetch, may be null
    correlator_t(art_transmitter_t &transmitter, microsecond_t deadline = make_timespan(5),
                 art_lookup_t *lookup = nullptr, art_fetcher_t *fetcher = nullptr);

    correlator_t(const correlator_t &) = delete;
    correlator_t &operator=(const correlator_t &) = delete;

    /// the current track changed. ready chunks for another hash are dropped
    void set_expected(art_hash_t hash);
    /// the current track has no artwork. forgets the expected hash and the ready chunks
    void clear_expected();
    /// the current track's artwork is prepared. wakes waiting windows
    void publish(art_hash_t hash, art_chunks_t chunks);

    std::shared_ptr<const art_chunks_t> current_chunks();
    std::optional<art_hash_t> expected_hash();

    /// resolve one request from 'peer'. blocks until sent, timed out or missed
    correlation_result resolve(const peer_id_t &peer, art_hash_t hash);

    /// close every open window of 'peer' as superseded
    void cancel_peer(const peer_id_t &peer);
    /// close every open window as superseded
    void cancel_all();

    /// count of open windows
    u64 pending();

    void set_lookup(art_lookup_t *lookup) { this->lookup = lookup; }
    void set_fetcher(art_fetcher_t *fetcher) { this->fetcher = fetcher; }
};

} // namespace dash
