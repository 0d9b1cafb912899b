#ifndef CADENCE_SCHEDULE_HPP
#define CADENCE_SCHEDULE_HPP

#include "trader/data_structures/data_structures.hpp"
#include "utils/session_clock.hpp"
#include "wall_clock.hpp"

namespace SellManager {
namespace Threads {

struct CadenceFire {
    WallTime fire_time;
    Core::CadenceTrigger trigger;
};

// Every fire time is strictly after the given instant, so feeding a fire time back in
// enumerates the nominal schedule.

// Next calendar minute boundary.
CadenceFire next_minute_fire(WallTime after_time);

// Next exchange-local hour boundary or end-of-day fire, whichever comes first.
CadenceFire next_hour_cadence_fire(WallTime after_time, const Core::ExchangeSessionClock& session_clock);

// End-of-day fire on or after the local date of after_time, skipping weekends when configured.
WallTime next_end_of_day_fire(WallTime after_time, const Core::ExchangeSessionClock& session_clock);

} // namespace Threads
} // namespace SellManager

#endif // CADENCE_SCHEDULE_HPP
