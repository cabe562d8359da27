#include <remoteimage/cache/image_cache.hpp>
#include <remoteimage/decode/image_decoder.hpp>

#include <gtest/gtest.h>

#include <thread>

using namespace remoteimage;

namespace
{
ImagePtr make_image(int rows, int cols, uint8_t fill)
{
    return std::make_shared<const cv::Mat>(rows, cols, CV_8UC3, cv::Scalar(fill, fill, fill));
}
} // namespace

TEST(image_cache, get_after_set_returns_payload)
{
    // GIVEN: a cache and an image
    ImageCache cache(CacheConfig{1000, 0});
    ImagePtr image = make_image(2, 2, 7);

    // WHEN: we store it
    ASSERT_TRUE(cache.set("http://a/1.png", image, 12));

    // THEN: we get the same payload back
    auto entry = cache.get("http://a/1.png");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->payload, image);
    EXPECT_EQ(entry->size, 12u);
    EXPECT_EQ(entry->key, "http://a/1.png");
    EXPECT_EQ(cache.getCacheHits(), 1u);
    EXPECT_EQ(cache.getCacheMisses(), 0u);
}

TEST(image_cache, missing_key_is_a_miss)
{
    ImageCache cache;
    EXPECT_FALSE(cache.get("http://a/missing.png").has_value());
    EXPECT_EQ(cache.getCacheMisses(), 1u);
}

TEST(image_cache, count_capacity_evicts_least_recently_used)
{
    // GIVEN: a cache holding at most 2 entries
    ImageCache cache(CacheConfig{0, 2});

    // WHEN: A, B and C are inserted in that order
    cache.set("A", make_image(1, 1, 1), 3);
    cache.set("B", make_image(1, 1, 2), 3);
    cache.set("C", make_image(1, 1, 3), 3);

    // THEN: A is gone, B and C remain
    EXPECT_FALSE(cache.contains("A"));
    EXPECT_TRUE(cache.contains("B"));
    EXPECT_TRUE(cache.contains("C"));
    EXPECT_EQ(cache.size_entries(), 2u);
    EXPECT_EQ(cache.getEvictions(), 1u);
}

TEST(image_cache, access_refreshes_eviction_order)
{
    // GIVEN: a full two entry cache where A was read after B was written
    ImageCache cache(CacheConfig{0, 2});
    cache.set("A", make_image(1, 1, 1), 3);
    cache.set("B", make_image(1, 1, 2), 3);
    ASSERT_TRUE(cache.get("A").has_value());

    // WHEN: a third entry arrives
    cache.set("C", make_image(1, 1, 3), 3);

    // THEN: B was the least recently accessed
    EXPECT_TRUE(cache.contains("A"));
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_TRUE(cache.contains("C"));
}

TEST(image_cache, byte_capacity_evicts_until_within_limit)
{
    ImageCache cache(CacheConfig{100, 0});
    cache.set("A", make_image(1, 1, 1), 40);
    cache.set("B", make_image(1, 1, 2), 40);
    cache.set("C", make_image(1, 1, 3), 10);
    EXPECT_EQ(cache.size_bytes(), 90u);

    // needs 70 bytes gone: A and B both go, C still fits
    cache.set("D", make_image(1, 1, 4), 80);

    EXPECT_FALSE(cache.contains("A"));
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_TRUE(cache.contains("C"));
    EXPECT_TRUE(cache.contains("D"));
    EXPECT_EQ(cache.size_bytes(), 90u);
    EXPECT_EQ(cache.getEvictions(), 2u);
}

TEST(image_cache, inserted_entry_survives_its_own_insertion)
{
    ImageCache cache(CacheConfig{100, 1});
    cache.set("A", make_image(1, 1, 1), 60);
    cache.set("B", make_image(1, 1, 2), 100);

    EXPECT_TRUE(cache.contains("B"));
    EXPECT_FALSE(cache.contains("A"));
    EXPECT_EQ(cache.size_bytes(), 100u);
}

TEST(image_cache, refuses_entry_larger_than_capacity)
{
    ImageCache cache(CacheConfig{100, 0});
    cache.set("A", make_image(1, 1, 1), 50);

    EXPECT_FALSE(cache.set("huge", make_image(1, 1, 2), 101));

    EXPECT_FALSE(cache.contains("huge"));
    EXPECT_TRUE(cache.contains("A"));
    EXPECT_EQ(cache.size_bytes(), 50u);
}

TEST(image_cache, replacing_entry_updates_size)
{
    ImageCache cache(CacheConfig{100, 0});
    ImagePtr first = make_image(1, 1, 1);
    ImagePtr second = make_image(1, 1, 2);
    cache.set("A", first, 30);
    cache.set("A", second, 50);

    EXPECT_EQ(cache.size_entries(), 1u);
    EXPECT_EQ(cache.size_bytes(), 50u);
    EXPECT_EQ(cache.get("A")->payload, second);

    // setting the identical payload again changes nothing
    cache.set("A", second, 50);
    EXPECT_EQ(cache.size_entries(), 1u);
    EXPECT_EQ(cache.size_bytes(), 50u);
}

TEST(image_cache, default_size_is_decoded_byte_count)
{
    ImageCache cache(CacheConfig{0, 0});
    ImagePtr image = make_image(4, 5, 1);
    cache.set("A", image);
    EXPECT_EQ(cache.size_bytes(), 4u * 5u * 3u);
    EXPECT_EQ(cache.size_bytes(), image_byte_size(*image));
}

TEST(image_cache, invalidate_and_clear)
{
    ImageCache cache(CacheConfig{0, 0});
    cache.set("A", make_image(1, 1, 1), 10);
    cache.set("B", make_image(1, 1, 2), 20);

    EXPECT_TRUE(cache.invalidate("A"));
    EXPECT_FALSE(cache.invalidate("A"));
    EXPECT_FALSE(cache.contains("A"));
    EXPECT_EQ(cache.size_bytes(), 20u);

    cache.clear();
    EXPECT_EQ(cache.size_entries(), 0u);
    EXPECT_EQ(cache.size_bytes(), 0u);
    EXPECT_FALSE(cache.get("B").has_value());
}

TEST(image_cache, get_updates_last_access)
{
    ImageCache cache(CacheConfig{0, 0});
    cache.set("A", make_image(1, 1, 1), 10);
    auto first = cache.get("A");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    auto second = cache.get("A");
    ASSERT_TRUE(first && second);
    EXPECT_GT(second->last_access, first->last_access);
}

TEST(image_cache, concurrent_access_keeps_capacity_invariant)
{
    // GIVEN: a small cache hammered from several threads
    ImageCache cache(CacheConfig{500, 8});
    ImagePtr image = make_image(1, 1, 1);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++)
    {
        threads.emplace_back([&cache, &image, t]() {
            for (int i = 0; i < 500; i++)
            {
                std::string key = "k" + std::to_string((i * 7 + t) % 20);
                cache.set(key, image, 10 + (i % 50));
                cache.get("k" + std::to_string(i % 20));
            }
        });
    }
    for (auto &t : threads)
    {
        t.join();
    }

    // THEN: both limits hold
    EXPECT_LE(cache.size_bytes(), 500u);
    EXPECT_LE(cache.size_entries(), 8u);
    EXPECT_EQ(cache.getCacheHits() + cache.getCacheMisses(), 2000u);
}
