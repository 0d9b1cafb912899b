#include <gtest/gtest.h>
#include "support/test_support.hpp"
#include "threads/scheduling/cadence_schedule.hpp"
#include "utils/time_utils.hpp"

using namespace SellManager;
using SellManager::Core::CadenceTrigger;
using SellManager::Testing::wall_time_from_epoch;
using TimeUtils::make_utc_timestamp;

namespace {

long long epoch_of(Threads::WallTime wall_time) {
    return TimeUtils::time_point_to_epoch_seconds(wall_time);
}

} // namespace

TEST(CadenceScheduleTest, MinuteFireIsTheNextBoundary) {
    long long base_time = make_utc_timestamp(2024, 1, 8, 15, 7, 0);

    Threads::CadenceFire mid_minute_fire = Threads::next_minute_fire(wall_time_from_epoch(base_time + 12));
    EXPECT_EQ(epoch_of(mid_minute_fire.fire_time), base_time + 60);
    EXPECT_EQ(mid_minute_fire.trigger, CadenceTrigger::MINUTE);

    // Exactly on a boundary the fire is the following one
    EXPECT_EQ(epoch_of(Threads::next_minute_fire(wall_time_from_epoch(base_time)).fire_time), base_time + 60);
}

TEST(CadenceScheduleTest, MinuteFireIgnoresSubSecondOffsets) {
    long long base_time = make_utc_timestamp(2024, 1, 8, 15, 7, 59);
    Threads::WallTime almost_boundary = wall_time_from_epoch(base_time) + std::chrono::milliseconds(999);
    EXPECT_EQ(epoch_of(Threads::next_minute_fire(almost_boundary).fire_time), base_time + 1);
}

TEST(CadenceScheduleTest, HourFireAlignsToLocalHours) {
    Core::ExchangeSessionClock session_clock(Testing::eastern_session_config());

    // 10:17 EST -> 11:00 EST
    Threads::CadenceFire hour_fire = Threads::next_hour_cadence_fire(
        wall_time_from_epoch(make_utc_timestamp(2024, 1, 8, 15, 17, 0)), session_clock);
    EXPECT_EQ(epoch_of(hour_fire.fire_time), make_utc_timestamp(2024, 1, 8, 16, 0, 0));
    EXPECT_EQ(hour_fire.trigger, CadenceTrigger::TOP_OF_HOUR);
}

TEST(CadenceScheduleTest, EndOfDayFireComesBeforeTheFourOClockHour) {
    Core::ExchangeSessionClock session_clock(Testing::eastern_session_config());

    // 15:00 EST fire handled, next is 15:59:55 EST rather than 16:00
    Threads::CadenceFire end_of_day_fire = Threads::next_hour_cadence_fire(
        wall_time_from_epoch(make_utc_timestamp(2024, 1, 8, 20, 0, 0)), session_clock);
    EXPECT_EQ(epoch_of(end_of_day_fire.fire_time), make_utc_timestamp(2024, 1, 8, 20, 59, 55));
    EXPECT_EQ(end_of_day_fire.trigger, CadenceTrigger::END_OF_DAY);

    Threads::CadenceFire after_end_of_day = Threads::next_hour_cadence_fire(end_of_day_fire.fire_time, session_clock);
    EXPECT_EQ(epoch_of(after_end_of_day.fire_time), make_utc_timestamp(2024, 1, 8, 21, 0, 0));
    EXPECT_EQ(after_end_of_day.trigger, CadenceTrigger::TOP_OF_HOUR);
}

TEST(CadenceScheduleTest, EndOfDaySkipsTheWeekend) {
    Core::ExchangeSessionClock session_clock(Testing::eastern_session_config());

    // Friday after the fire -> Monday
    Threads::WallTime friday_evening = wall_time_from_epoch(make_utc_timestamp(2024, 1, 12, 22, 0, 0));
    EXPECT_EQ(epoch_of(Threads::next_end_of_day_fire(friday_evening, session_clock)), make_utc_timestamp(2024, 1, 15, 20, 59, 55));
}

TEST(CadenceScheduleTest, EndOfDayFiresOnWeekendsWhenConfigured) {
    Config::SessionConfig session_config = Testing::eastern_session_config();
    session_config.end_of_day_weekdays_only = false;
    Core::ExchangeSessionClock session_clock(session_config);

    Threads::WallTime friday_evening = wall_time_from_epoch(make_utc_timestamp(2024, 1, 12, 22, 0, 0));
    EXPECT_EQ(epoch_of(Threads::next_end_of_day_fire(friday_evening, session_clock)), make_utc_timestamp(2024, 1, 13, 20, 59, 55));
}

TEST(CadenceScheduleTest, EndOfDayFollowsDaylightSaving) {
    Core::ExchangeSessionClock session_clock(Testing::eastern_session_config());

    Threads::WallTime summer_morning = wall_time_from_epoch(make_utc_timestamp(2024, 7, 8, 14, 0, 0));
    EXPECT_EQ(epoch_of(Threads::next_end_of_day_fire(summer_morning, session_clock)), make_utc_timestamp(2024, 7, 8, 19, 59, 55));
}

TEST(CadenceScheduleTest, HourFiresStayStrictlyIncreasingAcrossFallBack) {
    Core::ExchangeSessionClock session_clock(Testing::eastern_session_config());

    Threads::WallTime fire_time = wall_time_from_epoch(make_utc_timestamp(2024, 11, 3, 3, 30, 0));
    for (int fire_index = 0; fire_index < 6; ++fire_index) {
        Threads::CadenceFire next_fire = Threads::next_hour_cadence_fire(fire_time, session_clock);
        EXPECT_GT(next_fire.fire_time, fire_time);
        EXPECT_LE(next_fire.fire_time - fire_time, std::chrono::hours(1));
        fire_time = next_fire.fire_time;
    }
}
