#include "dash/art_cache.hpp"

namespace dash
{

art_cache_t::art_cache_t(u64 capacity)
    : capacity(capacity)
    , hits(0)
    , misses(0)
{
    if (capacity == 0)
        throw dash_param_exception("artwork cache capacity must be positive");
}

std::optional<art_chunks_t> art_cache_t::get(art_hash_t hash)
{
    std::unique_lock<std::mutex> lock(mutex);
    auto it = index.find(hash);
    if (it == index.end())
    {
        misses++;
        return {};
    }
    hits++;
    entries.splice(entries.begin(), entries, it->second);
    return it->second->second;
}

void art_cache_t::put(art_hash_t hash, art_chunks_t chunks)
{
    std::unique_lock<std::mutex> lock(mutex);
    auto it = index.find(hash);
    if (it != index.end())
    {
        it->second->second = std::move(chunks);
        entries.splice(entries.begin(), entries, it->second);
        return;
    }
    entries.emplace_front(hash, std::move(chunks));
    index[hash] = entries.begin();
    if (entries.size() > capacity)
    {
        index.erase(entries.back().first);
        entries.pop_back();
    }
}

void art_cache_t::remove(art_hash_t hash)
{
    std::unique_lock<std::mutex> lock(mutex);
    auto it = index.find(hash);
    if (it == index.end())
        return;
    entries.erase(it->second);
    index.erase(it);
}

void art_cache_t::clear()
{
    std::unique_lock<std::mutex> lock(mutex);
    entries.clear();
    index.clear();
}

u64 art_cache_t::size() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return entries.size();
}

art_cache_stats_t art_cache_t::stats() const
{
    std::unique_lock<std::mutex> lock(mutex);
    art_cache_stats_t stats;
    stats.hits = hits;
    stats.misses = misses;
    stats.size = entries.size();
    stats.capacity = capacity;
    return stats;
}

} // namespace dash
