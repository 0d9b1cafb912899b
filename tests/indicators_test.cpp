#include <gtest/gtest.h>
#include "support/test_support.hpp"
#include "trader/errors/trading_errors.hpp"
#include "trader/strategy_analysis/indicators.hpp"

using namespace SellManager;
using namespace SellManager::Core;
using SellManager::Testing::make_series;

TEST(IndicatorsTest, SimpleMovingAverageAveragesTheTrailingWindow) {
    Series series = make_series(1700000000, 3600, 10, 100.0, 1.0);

    EXPECT_DOUBLE_EQ(*compute_moving_average(series, MovingAverageType::SMA, 5, 4), 102.0);
    EXPECT_DOUBLE_EQ(*compute_moving_average(series, MovingAverageType::SMA, 5, 9), 107.0);
}

TEST(IndicatorsTest, NoValueBeforeTheWindowIsFull) {
    Series series = make_series(1700000000, 3600, 10, 100.0, 1.0);

    EXPECT_FALSE(compute_moving_average(series, MovingAverageType::SMA, 5, 3).has_value());
    EXPECT_FALSE(compute_moving_average(series, MovingAverageType::EMA, 5, 3).has_value());
    EXPECT_FALSE(compute_moving_average(series, MovingAverageType::SMA, 20, 9).has_value());
    EXPECT_FALSE(compute_moving_average(series, MovingAverageType::SMA, 5, 10).has_value());
}

TEST(IndicatorsTest, ExponentialAverageIsSeededWithTheSimpleAverage) {
    Series series = make_series(1700000000, 3600, 10, 100.0, 1.0);

    EXPECT_DOUBLE_EQ(*compute_moving_average(series, MovingAverageType::EMA, 5, 4), 102.0);
    // alpha = 2 / 6: 105 / 3 + 102 * 2 / 3
    EXPECT_NEAR(*compute_moving_average(series, MovingAverageType::EMA, 5, 5), 103.0, 1e-9);
}

TEST(IndicatorsTest, SeriesFormMatchesPointwiseComputation) {
    Series series = make_series(1700000000, 3600, 40, 50.0, 0.5);
    for (MovingAverageType ma_type : {MovingAverageType::SMA, MovingAverageType::EMA}) {
        std::vector<std::optional<double>> values = compute_moving_average_series(series, ma_type, 10);
        ASSERT_EQ(values.size(), series.size());
        for (size_t bar_index = 0; bar_index < series.size(); ++bar_index) {
            std::optional<double> expected_value = compute_moving_average(series, ma_type, 10, bar_index);
            ASSERT_EQ(values[bar_index].has_value(), expected_value.has_value()) << bar_index;
            if (expected_value) {
                EXPECT_NEAR(*values[bar_index], *expected_value, 1e-9) << bar_index;
            }
        }
    }
}

TEST(IndicatorsTest, OnlyListedLengthsAreSupported) {
    for (int supported_length : {5, 10, 20, 50, 100, 150, 200}) {
        EXPECT_TRUE(is_supported_indicator_length(supported_length));
    }
    EXPECT_FALSE(is_supported_indicator_length(7));
    EXPECT_EQ(maximum_supported_length(), 200);

    Series series = make_series(1700000000, 3600, 10);
    EXPECT_THROW(compute_moving_average(series, MovingAverageType::SMA, 7, 9), InvalidConfigurationError);
}
