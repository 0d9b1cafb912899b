#include <gtest/gtest.h>
#include <filesystem>
#include <limits>
#include <thread>
#include "support/test_support.hpp"
#include "trader/cache/bar_cache_store.hpp"
#include "trader/cache/bar_record_codec.hpp"
#include "trader/errors/trading_errors.hpp"

using namespace SellManager;
using namespace SellManager::Core;
using SellManager::Testing::make_bar;
using SellManager::Testing::make_series;

namespace {

constexpr Timestamp FIRST_BAR = 1704723000;   // 2024-01-08 14:10 UTC
constexpr long long HALF_HOUR = 1800;
const std::string CACHE_KEY = "NASDAQ:AAPL:30m";

class BarCacheStoreTest : public ::testing::Test {
protected:
    BarCacheStoreTest() : cache_store(cache_directory.path()) {}

    Testing::TemporaryDirectory cache_directory;
    BarCacheStore cache_store;
};

} // namespace

TEST_F(BarCacheStoreTest, MissingKeyReadsEmpty) {
    EXPECT_TRUE(cache_store.read(CACHE_KEY).empty());
    SeriesExtent series_extent = cache_store.describe(CACHE_KEY);
    EXPECT_EQ(series_extent.bar_count, 0u);
    EXPECT_FALSE(series_extent.first_timestamp.has_value());
}

TEST_F(BarCacheStoreTest, MergeSortsAndPersistsOnePerLine) {
    Series incoming_bars = {make_bar(FIRST_BAR + 2 * HALF_HOUR, 102.0), make_bar(FIRST_BAR, 100.0),
                            make_bar(FIRST_BAR + HALF_HOUR, 101.0)};

    MergeResult merge_result = cache_store.merge(CACHE_KEY, incoming_bars);

    EXPECT_EQ(merge_result.bar_count, 3u);
    EXPECT_EQ(merge_result.inserted_count, 3u);
    EXPECT_EQ(*merge_result.earliest_changed_timestamp, FIRST_BAR);
    EXPECT_EQ(*merge_result.first_timestamp, FIRST_BAR);
    EXPECT_EQ(*merge_result.last_timestamp, FIRST_BAR + 2 * HALF_HOUR);

    EXPECT_EQ(Testing::closes_of(cache_store.read(CACHE_KEY)), (std::vector<double>{100.0, 101.0, 102.0}));
    EXPECT_EQ(cache_store.cache_file_path(CACHE_KEY),
              (std::filesystem::path(cache_directory.path()) / "NASDAQ__AAPL__30m.ndjson").string());
    EXPECT_EQ(Testing::read_lines(cache_store.cache_file_path(CACHE_KEY)).size(), 3u);
}

TEST_F(BarCacheStoreTest, IncomingBarWinsOnCollision) {
    cache_store.merge(CACHE_KEY, make_series(FIRST_BAR, HALF_HOUR, 5));

    MergeResult merge_result = cache_store.merge(CACHE_KEY, {make_bar(FIRST_BAR + 3 * HALF_HOUR, 50.0)});

    EXPECT_EQ(merge_result.replaced_count, 1u);
    EXPECT_EQ(merge_result.inserted_count, 0u);
    EXPECT_EQ(merge_result.bar_count, 5u);
    EXPECT_EQ(*merge_result.earliest_changed_timestamp, FIRST_BAR + 3 * HALF_HOUR);
    EXPECT_EQ(Testing::closes_of(cache_store.read(CACHE_KEY)), (std::vector<double>{100.0, 101.0, 102.0, 50.0, 104.0}));
}

TEST_F(BarCacheStoreTest, RepeatedTimestampInBatchKeepsTheLastOccurrence) {
    cache_store.merge(CACHE_KEY, {make_bar(FIRST_BAR, 1.0), make_bar(FIRST_BAR, 2.0), make_bar(FIRST_BAR, 3.0)});

    Series cached_bars = cache_store.read(CACHE_KEY);
    ASSERT_EQ(cached_bars.size(), 1u);
    EXPECT_DOUBLE_EQ(cached_bars[0].close_price, 3.0);
}

TEST_F(BarCacheStoreTest, IdenticalMergeChangesNothing) {
    Series bars = make_series(FIRST_BAR, HALF_HOUR, 4);
    cache_store.merge(CACHE_KEY, bars);

    MergeResult merge_result = cache_store.merge(CACHE_KEY, bars);

    EXPECT_FALSE(merge_result.changed());
    EXPECT_FALSE(merge_result.earliest_changed_timestamp.has_value());
    EXPECT_EQ(merge_result.bar_count, 4u);
    EXPECT_FALSE(std::filesystem::exists(cache_store.cache_file_path(CACHE_KEY) + ".tmp"));
}

TEST_F(BarCacheStoreTest, ReadWindows) {
    cache_store.merge(CACHE_KEY, make_series(FIRST_BAR, HALF_HOUR, 10));

    EXPECT_EQ(Testing::closes_of(cache_store.read(CACHE_KEY, CacheReadWindow::last(3))),
              (std::vector<double>{107.0, 108.0, 109.0}));
    EXPECT_EQ(cache_store.read(CACHE_KEY, CacheReadWindow::from(FIRST_BAR + 6 * HALF_HOUR)).size(), 4u);
    EXPECT_EQ(Testing::closes_of(cache_store.read(CACHE_KEY, CacheReadWindow::between(FIRST_BAR + HALF_HOUR, FIRST_BAR + 3 * HALF_HOUR))),
              (std::vector<double>{101.0, 102.0, 103.0}));

    SeriesExtent series_extent = cache_store.describe(CACHE_KEY);
    EXPECT_EQ(series_extent.bar_count, 10u);
    EXPECT_EQ(*series_extent.last_timestamp, FIRST_BAR + 9 * HALF_HOUR);
}

TEST_F(BarCacheStoreTest, MergeAndReadReturnsTheMergedWindow) {
    cache_store.merge(CACHE_KEY, make_series(FIRST_BAR, HALF_HOUR, 3));

    Series recent_bars = cache_store.merge_and_read(CACHE_KEY, {make_bar(FIRST_BAR + 3 * HALF_HOUR, 200.0)}, CacheReadWindow::last(2));

    EXPECT_EQ(Testing::closes_of(recent_bars), (std::vector<double>{102.0, 200.0}));
}

TEST_F(BarCacheStoreTest, NonFiniteBarIsRejected) {
    Bar broken_bar = make_bar(FIRST_BAR, 100.0);
    broken_bar.close_price = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW(cache_store.merge(CACHE_KEY, {broken_bar}), std::invalid_argument);
    EXPECT_TRUE(cache_store.read(CACHE_KEY).empty());
}

TEST_F(BarCacheStoreTest, UnparsableFileIsReportedAsCorruption) {
    Testing::write_text_file(cache_store.cache_file_path(CACHE_KEY), encode_bar_record(make_bar(FIRST_BAR, 1.0)) + "\nnot json\n");

    try {
        cache_store.read(CACHE_KEY);
        FAIL() << "expected CacheCorruptionError";
    } catch (const CacheCorruptionError& corruption_error) {
        EXPECT_EQ(corruption_error.cache_key(), CACHE_KEY);
    }
}

TEST_F(BarCacheStoreTest, OutOfOrderFileIsReportedAsCorruption) {
    Testing::write_text_file(cache_store.cache_file_path(CACHE_KEY),
                             encode_bar_record(make_bar(FIRST_BAR + HALF_HOUR, 1.0)) + "\n" +
                             encode_bar_record(make_bar(FIRST_BAR, 2.0)) + "\n");

    EXPECT_THROW(cache_store.describe(CACHE_KEY), CacheCorruptionError);
    EXPECT_THROW(cache_store.merge(CACHE_KEY, {make_bar(FIRST_BAR + 5 * HALF_HOUR, 3.0)}), CacheCorruptionError);
    EXPECT_FALSE(std::filesystem::exists(cache_store.cache_file_path(CACHE_KEY) + ".tmp"));
}

TEST_F(BarCacheStoreTest, ConcurrentMergesOnOneKeyLoseNothing) {
    std::vector<std::thread> writer_threads;
    for (int writer_index = 0; writer_index < 4; ++writer_index) {
        writer_threads.emplace_back([this, writer_index]() {
            for (int bar_index = 0; bar_index < 10; ++bar_index) {
                Timestamp bar_timestamp = FIRST_BAR + (writer_index * 10 + bar_index) * HALF_HOUR;
                cache_store.merge(CACHE_KEY, {make_bar(bar_timestamp, 100.0 + writer_index)});
            }
        });
    }
    for (std::thread& writer_thread : writer_threads) {
        writer_thread.join();
    }

    EXPECT_EQ(cache_store.describe(CACHE_KEY).bar_count, 40u);
}

TEST(BarRecordCodecTest, DecodesWhatItEncodes) {
    Bar original_bar(FIRST_BAR, 10.25, 11.5, 9.75, 11.0, 12345.0);

    std::optional<Bar> decoded_bar = decode_bar_record(encode_bar_record(original_bar));

    ASSERT_TRUE(decoded_bar.has_value());
    EXPECT_TRUE(*decoded_bar == original_bar);
    EXPECT_FALSE(decode_bar_record("{\"t\":1}").has_value());
    EXPECT_FALSE(decode_bar_record("garbage").has_value());
}

TEST(GranularityTest, ParsingFoldsAsciiCaseAndRejectsOtherBytes) {
    EXPECT_EQ(parse_granularity("1H"), Granularity::HOUR);
    EXPECT_EQ(parse_granularity("30MIN"), Granularity::HALF_HOUR);
    EXPECT_EQ(make_cache_key("NYSE:KO", parse_granularity("1D")), "NYSE:KO:1d");
    EXPECT_THROW(parse_granularity("1\xC3\x84"), InvalidConfigurationError);
}
