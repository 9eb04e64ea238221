/**
* \file art_cache.hpp
* \author DashLink developers
* \brief LRU cache of prepared artwork chunk lists
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
#include "correlator.hpp"
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace dash
{

struct art_cache_stats_t
{
    u64 hits;
    u64 misses;
    u64 size;
    u64 capacity;

    double hit_rate() const { return hits + misses > 0 ? (double)hits / (hits + misses) : 0; }
};

class art_cache_t : public art_lookup_t
{
    using entry_t = std::pair<art_hash_t, art_chunks_t>;

    mutable std::mutex mutex;
    /// most recently used at front
    std::list<entry_t> entries;
    std::unordered_map<art_hash_t, std::list<entry_t>::iterator> index;
    u64 capacity;
    u64 hits;
    u64 misses;

  public:
    art_cache_t(u64 capacity = 10);

    art_cache_t(const art_cache_t &) = delete;
    art_cache_t &operator=(const art_cache_t &) = delete;

    /// counts a hit or a miss
    std::optional<art_chunks_t> get(art_hash_t hash);
    /// insert or replace, evicting the least recently used entry when full
    void put(art_hash_t hash, art_chunks_t chunks);
    void remove(art_hash_t hash);
    void clear();
    u64 size() const;
    art_cache_stats_t stats() const;

    std::optional<art_chunks_t> lookup(art_hash_t hash) override { return get(hash); }
};

} // namespace dash
