#include "test.hpp"
#include "test_support.hpp"

#include "folio/core/cache/MemoryBoundedCache.hpp"
#include "folio/core/util/Errors.hpp"

#include <limits>
#include <thread>

using folio::MemoryBoundedCache;

namespace {

// A budget that fits exactly `n` values of `len` bytes
double budgetFor(std::size_t n, std::size_t len)
{
    return static_cast<double>(n * (folio::kStringOverheadBytes + len)) / folio::kBytesPerMb;
}

} // namespace

TEST(MemoryBoundedCache, RejectsNonPositiveBudget)
{
    auto log = folio_test::quietLogger();
    EXPECT_THROW(MemoryBoundedCache c(0.0, "i", log), folio::ConfigurationError);
    EXPECT_THROW(MemoryBoundedCache c(-1.0, "i", log), folio::ConfigurationError);
    EXPECT_THROW(MemoryBoundedCache c(std::numeric_limits<double>::quiet_NaN(), "i", log),
                 folio::ConfigurationError);
}

TEST(MemoryBoundedCache, SizeEstimateGrowsWithLength)
{
    EXPECT_EQ(folio::estimateBytes("abc"), folio::estimateBytes("xyz"));
    EXPECT_LT(folio::estimateBytes("abc"), folio::estimateBytes("abcd"));
    EXPECT_GT(folio::estimateBytes(""), 0u);
}

TEST(MemoryBoundedCache, StaysWithinBudget)
{
    MemoryBoundedCache cache(budgetFor(4, 100), "i", folio_test::quietLogger());
    for (int i = 0; i < 40; ++i) {
        cache.set("img" + std::to_string(i), std::string(static_cast<size_t>(20 + (i * 37) % 150), 'q'));
        EXPECT_LE(cache.estimatedBytes(), cache.maxBytes());
    }
    EXPECT_GT(cache.stats().evictions, 0u);
}

TEST(MemoryBoundedCache, LargeInsertEvictsSeveralEntries)
{
    MemoryBoundedCache cache(budgetFor(4, 100), "i", folio_test::quietLogger());
    cache.set("a", std::string(100, 'a'));
    cache.set("b", std::string(100, 'b'));
    cache.set("c", std::string(100, 'c'));
    cache.set("d", std::string(100, 'd'));
    EXPECT_EQ(cache.size(), 4u);

    // Needs the room of three small entries
    cache.set("big", std::string(3 * 100 + 2 * folio::kStringOverheadBytes, 'z'));
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_FALSE(cache.contains("c"));
    EXPECT_TRUE(cache.contains("d"));
    EXPECT_TRUE(cache.contains("big"));
    EXPECT_EQ(cache.stats().evictions, 3u);
    EXPECT_LE(cache.estimatedBytes(), cache.maxBytes());
}

TEST(MemoryBoundedCache, EvictsLeastRecentlyUsedFirst)
{
    MemoryBoundedCache cache(budgetFor(3, 10), "i", folio_test::quietLogger());
    cache.set("a", std::string(10, 'a'));
    cache.set("b", std::string(10, 'b'));
    cache.set("c", std::string(10, 'c'));
    cache.get("a");
    cache.set("d", std::string(10, 'd'));

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_TRUE(cache.contains("d"));
}

TEST(MemoryBoundedCache, ShrinkingUpdateNeverEvicts)
{
    MemoryBoundedCache cache(budgetFor(2, 100), "i", folio_test::quietLogger());
    cache.set("a", std::string(100, 'a'));
    cache.set("b", std::string(100, 'b'));
    cache.set("a", std::string(10, 'a'));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.stats().evictions, 0u);
    EXPECT_EQ(cache.estimatedBytes(), folio::estimateBytes(std::string(10, 'a')) +
                                          folio::estimateBytes(std::string(100, 'b')));
}

TEST(MemoryBoundedCache, OversizedItemIsStoredOverBudget)
{
    auto recorder = std::make_shared<folio_test::LogRecorder>();
    MemoryBoundedCache cache(budgetFor(2, 10), "i", folio_test::quietLogger(recorder));
    cache.set("a", std::string(10, 'a'));
    cache.set("b", std::string(10, 'b'));

    const std::string huge(cache.maxBytes() * 2, 'h');
    cache.set("huge", huge);

    // Everything else goes, the huge item stays and the cache is over budget
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains("huge"));
    EXPECT_GT(cache.estimatedBytes(), cache.maxBytes());
    EXPECT_EQ(cache.stats().evictions, 2u);
    EXPECT_EQ(recorder->count(folio::LogLevel::Warn, "exceeds the whole budget"), 1u);

    // The next insert evicts it again
    cache.set("c", std::string(10, 'c'));
    EXPECT_FALSE(cache.contains("huge"));
    EXPECT_LE(cache.estimatedBytes(), cache.maxBytes());
}

TEST(MemoryBoundedCache, StatsCarryMemoryTelemetry)
{
    MemoryBoundedCache cache(budgetFor(4, 100), "i", folio_test::quietLogger());
    cache.set("a", std::string(100, 'a'));
    cache.set("b", std::string(100, 'b'));

    auto s = cache.stats();
    EXPECT_EQ(s.maxBytes, cache.maxBytes());
    EXPECT_EQ(s.estimatedBytes, 2 * folio::estimateBytes(std::string(100, 'a')));
    EXPECT_NEAR(s.memoryUtilization(), 50.0, 0.5);
    EXPECT_NEAR(s.averageItemBytes(), static_cast<double>(folio::estimateBytes(std::string(100, 'a'))), 1e-9);
    EXPECT_FALSE(s.secondsSinceLastEviction.has_value());
}

TEST(MemoryBoundedCache, ClearResetsEverything)
{
    MemoryBoundedCache cache(budgetFor(1, 10), "i", folio_test::quietLogger());
    cache.set("a", std::string(10, 'a'));
    cache.set("b", std::string(10, 'b'));
    cache.get("b");
    cache.get("a");

    cache.clear();
    auto s = cache.stats();
    EXPECT_EQ(s.size, 0u);
    EXPECT_EQ(s.estimatedBytes, 0u);
    EXPECT_EQ(s.hits, 0u);
    EXPECT_EQ(s.misses, 0u);
    EXPECT_EQ(s.evictions, 0u);

    cache.set("c", "again");
    EXPECT_EQ(*cache.get("c"), "again");
}

TEST(MemoryBoundedCache, ConcurrentWritersKeepAccountingConsistent)
{
    MemoryBoundedCache cache(budgetFor(16, 64), "i", folio_test::quietLogger());
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&cache, t]() {
            for (int i = 0; i < 500; ++i) {
                const std::string key = "t" + std::to_string(t) + "-" + std::to_string(i % 40);
                cache.set(key, std::string(static_cast<size_t>(16 + i % 48), 'v'));
                cache.get("t" + std::to_string((t + 1) % 4) + "-" + std::to_string(i % 40));
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_LE(cache.estimatedBytes(), cache.maxBytes());
    auto s = cache.stats();
    EXPECT_EQ(s.hits + s.misses, 2000u);
}
