#include "dash/art_cache.hpp"
#include "dash/test_helper.hpp"
#include <gtest/gtest.h>

using namespace dash;

TEST(ArtCacheTest, EvictsLeastRecentlyUsed)
{
    art_cache_t cache(2);
    cache.put(1, prepare_chunks(1, test::make_bytes(10)));
    cache.put(2, prepare_chunks(2, test::make_bytes(10)));
    GTEST_ASSERT_EQ(cache.get(1).has_value(), true);
    cache.put(3, prepare_chunks(3, test::make_bytes(10)));

    GTEST_ASSERT_EQ(cache.size(), 2u);
    GTEST_ASSERT_EQ(cache.get(2).has_value(), false);
    GTEST_ASSERT_EQ(cache.get(1).has_value(), true);
    GTEST_ASSERT_EQ(cache.get(3).has_value(), true);
}

TEST(ArtCacheTest, Replace)
{
    art_cache_t cache(2);
    cache.put(1, prepare_chunks(1, test::make_bytes(10)));
    cache.put(1, prepare_chunks(1, test::make_bytes(1000)));
    GTEST_ASSERT_EQ(cache.size(), 1u);
    GTEST_ASSERT_EQ(cache.get(1)->size(), 3u);
}

TEST(ArtCacheTest, Stats)
{
    art_cache_t cache(4);
    cache.put(1, prepare_chunks(1, test::make_bytes(10)));
    cache.get(1);
    cache.get(1);
    cache.get(1);
    cache.get(9);
    auto stats = cache.stats();
    GTEST_ASSERT_EQ(stats.hits, 3u);
    GTEST_ASSERT_EQ(stats.misses, 1u);
    GTEST_ASSERT_EQ(stats.size, 1u);
    GTEST_ASSERT_EQ(stats.capacity, 4u);
    GTEST_ASSERT_EQ(stats.hit_rate(), 0.75);
}

TEST(ArtCacheTest, RemoveAndClear)
{
    art_cache_t cache;
    cache.put(1, prepare_chunks(1, test::make_bytes(10)));
    cache.put(2, prepare_chunks(2, test::make_bytes(10)));
    cache.remove(1);
    GTEST_ASSERT_EQ(cache.lookup(1).has_value(), false);
    cache.clear();
    GTEST_ASSERT_EQ(cache.size(), 0u);
    EXPECT_THROW({ art_cache_t empty(0); }, dash_param_exception);
}
