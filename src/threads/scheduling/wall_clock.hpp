#ifndef WALL_CLOCK_HPP
#define WALL_CLOCK_HPP

#include <chrono>
#include "stop_signal.hpp"

namespace SellManager {
namespace Threads {

using WallTime = std::chrono::system_clock::time_point;

class WallClock {
public:
    virtual ~WallClock() = default;

    virtual WallTime now() const = 0;
    // Blocks until deadline; false when stop was requested first.
    virtual bool sleep_until(WallTime deadline, StopSignal& stop_signal) = 0;
};

class SystemWallClock : public WallClock {
public:
    WallTime now() const override;
    bool sleep_until(WallTime deadline, StopSignal& stop_signal) override;
};

} // namespace Threads
} // namespace SellManager

#endif // WALL_CLOCK_HPP
