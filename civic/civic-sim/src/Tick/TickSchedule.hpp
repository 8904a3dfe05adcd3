#ifndef CIVIC_SIM_TICK_TICK_SCHEDULE_HPP
#define CIVIC_SIM_TICK_TICK_SCHEDULE_HPP

#include <chrono>

#include "civic-sim/src/DataTypes/GameTime.hpp"
#include "civic-sim/src/Tick/TickRecord.hpp"

namespace civic_sim
{

/**
 * @brief Mapping from wall-clock time to the game month that should be
 * current
 *
 * expectedAt(now) = 1 + floor((now - epoch) / realTimePerTick), or the first
 * month when now precedes the epoch.
 */
struct TickSchedule
{
  WallClock::time_point epoch{};
  std::chrono::seconds realTimePerTick{std::chrono::hours{1}};

  [[nodiscard]] GameTime expectedAt(WallClock::time_point now) const
  {
    if (now <= epoch || realTimePerTick <= std::chrono::seconds::zero())
    {
      return GameTime::start();
    }
    auto const elapsedTicks = (now - epoch) / realTimePerTick;
    return GameTime::fromTotalMonths(1 + static_cast<uint32_t>(elapsedTicks));
  }
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_TICK_TICK_SCHEDULE_HPP
