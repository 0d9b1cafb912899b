#include "cadence_schedule.hpp"
#include "utils/time_utils.hpp"
#include <stdexcept>

namespace SellManager {
namespace Threads {

namespace {

// Whole seconds at or before the instant.
long long floor_epoch_seconds(WallTime time_value) {
    auto since_epoch = time_value.time_since_epoch();
    auto whole_seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    if (whole_seconds > since_epoch) {
        whole_seconds -= std::chrono::seconds(1);
    }
    return whole_seconds.count();
}

WallTime to_wall_time(long long epoch_seconds) {
    return WallTime(std::chrono::seconds(epoch_seconds));
}

} // namespace

CadenceFire next_minute_fire(WallTime after_time) {
    long long current_seconds = floor_epoch_seconds(after_time);
    long long next_boundary = TimeUtils::floor_to_multiple(current_seconds, TimeUtils::SECONDS_PER_MINUTE) + TimeUtils::SECONDS_PER_MINUTE;
    return CadenceFire{to_wall_time(next_boundary), Core::CadenceTrigger::MINUTE};
}

WallTime next_end_of_day_fire(WallTime after_time, const Core::ExchangeSessionClock& session_clock) {
    const Config::SessionConfig& session_config = session_clock.get_config();
    long long fire_offset_seconds = session_config.end_of_day_fire_hour * TimeUtils::SECONDS_PER_HOUR +
                                    session_config.end_of_day_fire_minute * TimeUtils::SECONDS_PER_MINUTE +
                                    session_config.end_of_day_fire_second;

    long long current_local = session_clock.to_local_seconds(floor_epoch_seconds(after_time));
    long long local_day = TimeUtils::floor_to_multiple(current_local, TimeUtils::SECONDS_PER_DAY) / TimeUtils::SECONDS_PER_DAY;

    // A week always holds a weekday.
    for (int day_offset = 0; day_offset <= 7; ++day_offset) {
        long long candidate_day = local_day + day_offset;
        if (session_config.end_of_day_weekdays_only) {
            int candidate_weekday = TimeUtils::weekday_from_days(candidate_day);
            if (candidate_weekday == 0 || candidate_weekday == 6) {
                continue;
            }
        }
        WallTime candidate_fire = to_wall_time(
            session_clock.local_seconds_to_utc(candidate_day * TimeUtils::SECONDS_PER_DAY + fire_offset_seconds));
        if (candidate_fire > after_time) {
            return candidate_fire;
        }
    }
    throw std::logic_error("No end-of-day fire found within a week");
}

CadenceFire next_hour_cadence_fire(WallTime after_time, const Core::ExchangeSessionClock& session_clock) {
    // Offsets are whole hours, so every local hour boundary is a UTC hour boundary. The repeated
    // hour when daylight saving ends fires twice; the skipped one in spring does not fire.
    long long next_hour_boundary = TimeUtils::floor_to_multiple(floor_epoch_seconds(after_time), TimeUtils::SECONDS_PER_HOUR) +
                                   TimeUtils::SECONDS_PER_HOUR;
    WallTime next_hour_fire = to_wall_time(next_hour_boundary);

    WallTime end_of_day_fire = next_end_of_day_fire(after_time, session_clock);
    if (end_of_day_fire < next_hour_fire) {
        return CadenceFire{end_of_day_fire, Core::CadenceTrigger::END_OF_DAY};
    }
    return CadenceFire{next_hour_fire, Core::CadenceTrigger::TOP_OF_HOUR};
}

} // namespace Threads
} // namespace SellManager
