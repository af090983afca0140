#include <gtest/gtest.h>

#include "image_cache.hpp"

#include <string>
#include <vector>

TEST(ImageCache, EvictsInInsertionOrder)
{
    FifoCache<int> cache(3);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);
    // reads do not refresh
    ASSERT_NE(cache.find("a"), nullptr);
    cache.put("d", 4);

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("b"));
    EXPECT_EQ(*cache.find("d"), 4);
}

TEST(ImageCache, OverwriteKeepsPosition)
{
    FifoCache<int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("a", 10);
    EXPECT_EQ(*cache.find("a"), 10);
    cache.put("c", 3);
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("b"));
}

TEST(ImageCache, BoundedAtCapacity)
{
    ImageCache cache(kImageCacheCapacity);
    for (int i = 0; i < 2000; ++i)
    {
        cache.put("key" + std::to_string(i), "data:image/png;base64,AA==");
        ASSERT_LE(cache.size(), kImageCacheCapacity);
    }
    EXPECT_EQ(cache.size(), 800u);
    EXPECT_FALSE(cache.contains("key1199"));
    EXPECT_TRUE(cache.contains("key1200"));
    EXPECT_TRUE(cache.contains("key1999"));
}

TEST(ImageCache, EvictionCallbackAndClear)
{
    std::vector<std::string> evicted;
    FifoCache<int> cache(2, [&](const std::string& key, int&) { evicted.push_back(key); });
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);
    EXPECT_EQ(evicted, (std::vector<std::string>{ "a" }));

    EXPECT_TRUE(cache.erase("b"));
    EXPECT_FALSE(cache.erase("b"));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(evicted, (std::vector<std::string>{ "a", "c" }));
}

TEST(ImageCache, EmptyKeyIgnored)
{
    ImageCache cache(4);
    cache.put("", "x");
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.find(""), nullptr);
}
