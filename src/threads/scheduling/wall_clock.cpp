#include "wall_clock.hpp"

namespace SellManager {
namespace Threads {

WallTime SystemWallClock::now() const {
    return std::chrono::system_clock::now();
}

bool SystemWallClock::sleep_until(WallTime deadline, StopSignal& stop_signal) {
    // Condition variable waits may return early; never report the deadline before it passes
    while (std::chrono::system_clock::now() < deadline) {
        if (stop_signal.wait_until(deadline)) {
            return false;
        }
    }
    return !stop_signal.stop_requested();
}

} // namespace Threads
} // namespace SellManager
