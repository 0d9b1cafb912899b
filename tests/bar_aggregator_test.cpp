#include <gtest/gtest.h>
#include "support/test_support.hpp"
#include "trader/cache/bar_cache_store.hpp"
#include "trader/errors/trading_errors.hpp"
#include "trader/market_data/bar_aggregator.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager;
using namespace SellManager::Core;
using TimeUtils::make_utc_timestamp;

namespace {

class BarAggregatorTest : public ::testing::Test {
protected:
    BarAggregatorTest() : session_clock(Testing::eastern_session_config()), aggregator(session_clock, 30) {}

    ExchangeSessionClock session_clock;
    BarAggregator aggregator;
};

} // namespace

TEST_F(BarAggregatorTest, OpeningHalfHourJoinsTheTenOClockBucket) {
    // 09:30 and 10:00 EST
    Timestamp opening_bar = make_utc_timestamp(2024, 1, 8, 14, 30, 0);
    Timestamp second_bar = make_utc_timestamp(2024, 1, 8, 15, 0, 0);
    Timestamp ten_o_clock = make_utc_timestamp(2024, 1, 8, 15, 0, 0);

    EXPECT_EQ(aggregator.hour_bucket_label(opening_bar), ten_o_clock);
    EXPECT_EQ(aggregator.hour_bucket_label(second_bar), ten_o_clock);
    EXPECT_EQ(aggregator.hour_bucket_start(second_bar), opening_bar);
    EXPECT_EQ(aggregator.hour_bucket_label(make_utc_timestamp(2024, 1, 8, 15, 30, 0)), make_utc_timestamp(2024, 1, 8, 16, 0, 0));
}

TEST_F(BarAggregatorTest, CombinesOpenHighLowCloseAndVolume) {
    Series half_hour_bars = {
        Bar(make_utc_timestamp(2024, 1, 8, 14, 30, 0), 10.0, 12.0, 9.0, 11.0, 100.0),
        Bar(make_utc_timestamp(2024, 1, 8, 15, 0, 0), 11.0, 14.0, 10.5, 13.0, 250.0),
        Bar(make_utc_timestamp(2024, 1, 8, 15, 30, 0), 13.0, 13.5, 8.0, 9.5, 50.0),
    };

    Series hourly_bars = aggregator.aggregate_to_hour(half_hour_bars);

    ASSERT_EQ(hourly_bars.size(), 2u);
    const Bar& first_hour = hourly_bars[0];
    EXPECT_EQ(first_hour.timestamp, make_utc_timestamp(2024, 1, 8, 15, 0, 0));
    EXPECT_DOUBLE_EQ(first_hour.open_price, 10.0);
    EXPECT_DOUBLE_EQ(first_hour.high_price, 14.0);
    EXPECT_DOUBLE_EQ(first_hour.low_price, 9.0);
    EXPECT_DOUBLE_EQ(first_hour.close_price, 13.0);
    EXPECT_DOUBLE_EQ(first_hour.volume, 350.0);

    // Single-bar bucket still produces a bar
    const Bar& second_hour = hourly_bars[1];
    EXPECT_EQ(second_hour.timestamp, make_utc_timestamp(2024, 1, 8, 16, 0, 0));
    EXPECT_DOUBLE_EQ(second_hour.open_price, 13.0);
    EXPECT_DOUBLE_EQ(second_hour.close_price, 9.5);
    EXPECT_DOUBLE_EQ(second_hour.volume, 50.0);
}

TEST_F(BarAggregatorTest, ResultDoesNotDependOnInputOrder) {
    Series half_hour_bars = Testing::make_series(make_utc_timestamp(2024, 1, 8, 14, 30, 0), 1800, 13, 50.0, 0.25);
    Series shuffled_bars(half_hour_bars.rbegin(), half_hour_bars.rend());
    std::swap(shuffled_bars[2], shuffled_bars[7]);

    Series expected_bars = aggregator.aggregate_to_hour(half_hour_bars);
    Series shuffled_result = aggregator.aggregate_to_hour(shuffled_bars);

    ASSERT_EQ(shuffled_result.size(), expected_bars.size());
    EXPECT_EQ(expected_bars.size(), 7u);
    for (size_t bar_index = 0; bar_index < expected_bars.size(); ++bar_index) {
        EXPECT_EQ(shuffled_result[bar_index].timestamp, expected_bars[bar_index].timestamp);
        EXPECT_DOUBLE_EQ(shuffled_result[bar_index].close_price, expected_bars[bar_index].close_price);
        EXPECT_DOUBLE_EQ(shuffled_result[bar_index].volume, expected_bars[bar_index].volume);
    }
}

TEST_F(BarAggregatorTest, BucketsFollowLocalTimeInSummer) {
    // 09:30 EDT
    Timestamp opening_bar = make_utc_timestamp(2024, 7, 8, 13, 30, 0);
    EXPECT_EQ(aggregator.hour_bucket_label(opening_bar), make_utc_timestamp(2024, 7, 8, 14, 0, 0));
}

TEST_F(BarAggregatorTest, RejectsAnchorOutsideTheHour) {
    EXPECT_THROW(BarAggregator(session_clock, 60), InvalidConfigurationError);
    EXPECT_THROW(BarAggregator(session_clock, -1), InvalidConfigurationError);
}

TEST_F(BarAggregatorTest, AggregateAndMergeRebuildsTheChangedBucket) {
    Testing::TemporaryDirectory cache_directory;
    BarCacheStore cache_store(cache_directory.path());
    std::string half_hour_key = make_cache_key("NASDAQ:AAPL", Granularity::HALF_HOUR);
    std::string hourly_key = make_cache_key("NASDAQ:AAPL", Granularity::HOUR);

    Timestamp opening_bar = make_utc_timestamp(2024, 1, 8, 14, 30, 0);
    cache_store.merge(half_hour_key, Testing::make_series(opening_bar, 1800, 4, 100.0, 1.0));
    aggregate_and_merge(cache_store, aggregator, "NASDAQ:AAPL", std::nullopt);
    ASSERT_EQ(cache_store.read(hourly_key).size(), 2u);

    // Second half of the 10:00 bucket revised
    Timestamp revised_bar = opening_bar + 1800;
    cache_store.merge(half_hour_key, {Bar(revised_bar, 101.0, 130.0, 100.0, 125.0, 10.0)});
    MergeResult merge_result = aggregate_and_merge(cache_store, aggregator, "NASDAQ:AAPL", revised_bar);

    EXPECT_EQ(merge_result.replaced_count, 1u);
    Series hourly_bars = cache_store.read(hourly_key);
    ASSERT_EQ(hourly_bars.size(), 2u);
    EXPECT_DOUBLE_EQ(hourly_bars[0].open_price, 100.0);
    EXPECT_DOUBLE_EQ(hourly_bars[0].high_price, 130.0);
    EXPECT_DOUBLE_EQ(hourly_bars[0].close_price, 125.0);
    EXPECT_DOUBLE_EQ(hourly_bars[0].volume, 1010.0);
}
