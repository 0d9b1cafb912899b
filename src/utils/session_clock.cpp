#include "session_clock.hpp"
#include "trader/errors/trading_errors.hpp"
#include "utils/time_utils.hpp"

namespace SellManager {
namespace Core {

namespace {
    constexpr long long DST_SHIFT_SECONDS = TimeUtils::SECONDS_PER_HOUR;
    constexpr int DST_TRANSITION_LOCAL_HOUR = 2;

    // Day number of the nth Sunday (1-based) of a month
    long long nth_sunday_of_month(int year, int month, int occurrence) {
        long long first_day = TimeUtils::days_from_civil(year, month, 1);
        int first_weekday = TimeUtils::weekday_from_days(first_day);
        long long first_sunday = first_day + ((7 - first_weekday) % 7);
        return first_sunday + 7LL * (occurrence - 1);
    }
}

ExchangeSessionClock::ExchangeSessionClock(const Config::SessionConfig& session_config)
    : config(session_config),
      standard_offset_seconds(static_cast<long long>(session_config.utc_offset_hours) * TimeUtils::SECONDS_PER_HOUR) {
    if (config.utc_offset_hours < -12 || config.utc_offset_hours > 14) {
        throw InvalidConfigurationError("session.utc_offset_hours out of range: " + std::to_string(config.utc_offset_hours));
    }
}

long long ExchangeSessionClock::dst_start_utc(int year) const {
    long long transition_day = nth_sunday_of_month(year, 3, 2);
    long long local_transition = transition_day * TimeUtils::SECONDS_PER_DAY + DST_TRANSITION_LOCAL_HOUR * TimeUtils::SECONDS_PER_HOUR;
    return local_transition - standard_offset_seconds;
}

long long ExchangeSessionClock::dst_end_utc(int year) const {
    long long transition_day = nth_sunday_of_month(year, 11, 1);
    long long local_transition = transition_day * TimeUtils::SECONDS_PER_DAY + DST_TRANSITION_LOCAL_HOUR * TimeUtils::SECONDS_PER_HOUR;
    return local_transition - (standard_offset_seconds + DST_SHIFT_SECONDS);
}

bool ExchangeSessionClock::is_daylight_saving(long long utc_epoch_seconds) const {
    if (!config.observe_us_dst) {
        return false;
    }
    long long standard_local = utc_epoch_seconds + standard_offset_seconds;
    int year = TimeUtils::civil_from_days(TimeUtils::floor_to_multiple(standard_local, TimeUtils::SECONDS_PER_DAY) / TimeUtils::SECONDS_PER_DAY).year;
    return utc_epoch_seconds >= dst_start_utc(year) && utc_epoch_seconds < dst_end_utc(year);
}

long long ExchangeSessionClock::utc_offset_seconds(long long utc_epoch_seconds) const {
    return standard_offset_seconds + (is_daylight_saving(utc_epoch_seconds) ? DST_SHIFT_SECONDS : 0);
}

long long ExchangeSessionClock::to_local_seconds(long long utc_epoch_seconds) const {
    return utc_epoch_seconds + utc_offset_seconds(utc_epoch_seconds);
}

long long ExchangeSessionClock::local_seconds_to_utc(long long local_epoch_seconds) const {
    long long standard_guess = local_epoch_seconds - standard_offset_seconds;
    long long candidate_utc = local_epoch_seconds - utc_offset_seconds(standard_guess);
    // Re-check once: the guess may sit on the other side of a transition
    return local_epoch_seconds - utc_offset_seconds(candidate_utc);
}

long long ExchangeSessionClock::local_midnight_utc(long long utc_epoch_seconds) const {
    long long local_seconds = to_local_seconds(utc_epoch_seconds);
    long long local_midnight = TimeUtils::floor_to_multiple(local_seconds, TimeUtils::SECONDS_PER_DAY);
    return local_seconds_to_utc(local_midnight);
}

int ExchangeSessionClock::local_weekday(long long utc_epoch_seconds) const {
    long long local_days = TimeUtils::floor_to_multiple(to_local_seconds(utc_epoch_seconds), TimeUtils::SECONDS_PER_DAY) / TimeUtils::SECONDS_PER_DAY;
    return TimeUtils::weekday_from_days(local_days);
}

bool ExchangeSessionClock::is_weekday(long long utc_epoch_seconds) const {
    int weekday = local_weekday(utc_epoch_seconds);
    return weekday >= 1 && weekday <= 5;
}

long long ExchangeSessionClock::market_open_utc_on_local_date(long long utc_epoch_seconds) const {
    long long local_midnight = TimeUtils::floor_to_multiple(to_local_seconds(utc_epoch_seconds), TimeUtils::SECONDS_PER_DAY);
    long long local_open = local_midnight + config.market_open_hour * TimeUtils::SECONDS_PER_HOUR +
                           config.market_open_minute * TimeUtils::SECONDS_PER_MINUTE;
    return local_seconds_to_utc(local_open);
}

} // namespace Core
} // namespace SellManager
