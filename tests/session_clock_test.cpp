#include <gtest/gtest.h>
#include "support/test_support.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/session_clock.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager;
using SellManager::Core::ExchangeSessionClock;
using TimeUtils::make_utc_timestamp;

TEST(ExchangeSessionClockTest, UsesStandardOffsetInWinter) {
    ExchangeSessionClock session_clock(Testing::eastern_session_config());
    long long winter_noon_utc = make_utc_timestamp(2024, 1, 8, 17, 0, 0);

    EXPECT_FALSE(session_clock.is_daylight_saving(winter_noon_utc));
    EXPECT_EQ(session_clock.utc_offset_seconds(winter_noon_utc), -5 * 3600);
    EXPECT_EQ(session_clock.to_local_seconds(winter_noon_utc), make_utc_timestamp(2024, 1, 8, 12, 0, 0));
}

TEST(ExchangeSessionClockTest, UsesDaylightOffsetInSummer) {
    ExchangeSessionClock session_clock(Testing::eastern_session_config());
    long long summer_noon_utc = make_utc_timestamp(2024, 7, 8, 16, 0, 0);

    EXPECT_TRUE(session_clock.is_daylight_saving(summer_noon_utc));
    EXPECT_EQ(session_clock.to_local_seconds(summer_noon_utc), make_utc_timestamp(2024, 7, 8, 12, 0, 0));
}

TEST(ExchangeSessionClockTest, SwitchesAtTheUsTransitionInstants) {
    ExchangeSessionClock session_clock(Testing::eastern_session_config());

    // Second Sunday of March 2024, 02:00 EST
    EXPECT_FALSE(session_clock.is_daylight_saving(make_utc_timestamp(2024, 3, 10, 6, 59, 59)));
    EXPECT_TRUE(session_clock.is_daylight_saving(make_utc_timestamp(2024, 3, 10, 7, 0, 0)));

    // First Sunday of November 2024, 02:00 EDT
    EXPECT_TRUE(session_clock.is_daylight_saving(make_utc_timestamp(2024, 11, 3, 5, 59, 59)));
    EXPECT_FALSE(session_clock.is_daylight_saving(make_utc_timestamp(2024, 11, 3, 6, 0, 0)));
}

TEST(ExchangeSessionClockTest, IgnoresDaylightSavingWhenDisabled) {
    Config::SessionConfig session_config = Testing::eastern_session_config();
    session_config.observe_us_dst = false;
    ExchangeSessionClock session_clock(session_config);

    EXPECT_FALSE(session_clock.is_daylight_saving(make_utc_timestamp(2024, 7, 8, 16, 0, 0)));
    EXPECT_EQ(session_clock.utc_offset_seconds(make_utc_timestamp(2024, 7, 8, 16, 0, 0)), -5 * 3600);
}

TEST(ExchangeSessionClockTest, LocalToUtcRoundTripsOutsideTransitions) {
    ExchangeSessionClock session_clock(Testing::eastern_session_config());

    EXPECT_EQ(session_clock.local_seconds_to_utc(make_utc_timestamp(2024, 1, 8, 9, 30, 0)), make_utc_timestamp(2024, 1, 8, 14, 30, 0));
    EXPECT_EQ(session_clock.local_seconds_to_utc(make_utc_timestamp(2024, 7, 8, 9, 30, 0)), make_utc_timestamp(2024, 7, 8, 13, 30, 0));
}

TEST(ExchangeSessionClockTest, MarketOpenFollowsTheLocalDate) {
    ExchangeSessionClock session_clock(Testing::eastern_session_config());

    // 03:00 UTC on the 9th is still the evening of the 8th in New York
    long long late_evening_utc = make_utc_timestamp(2024, 1, 9, 3, 0, 0);
    EXPECT_EQ(session_clock.market_open_utc_on_local_date(late_evening_utc), make_utc_timestamp(2024, 1, 8, 14, 30, 0));
    EXPECT_EQ(session_clock.local_midnight_utc(late_evening_utc), make_utc_timestamp(2024, 1, 8, 5, 0, 0));
}

TEST(ExchangeSessionClockTest, ReportsLocalWeekday) {
    ExchangeSessionClock session_clock(Testing::eastern_session_config());

    // Saturday 2024-01-13 01:00 UTC is Friday evening locally
    long long friday_evening_utc = make_utc_timestamp(2024, 1, 13, 1, 0, 0);
    EXPECT_EQ(session_clock.local_weekday(friday_evening_utc), 5);
    EXPECT_TRUE(session_clock.is_weekday(friday_evening_utc));
    EXPECT_FALSE(session_clock.is_weekday(make_utc_timestamp(2024, 1, 13, 17, 0, 0)));
}

TEST(ExchangeSessionClockTest, RejectsOutOfRangeOffset) {
    Config::SessionConfig session_config = Testing::eastern_session_config();
    session_config.utc_offset_hours = 20;
    EXPECT_THROW(ExchangeSessionClock session_clock(session_config), Core::InvalidConfigurationError);
}
