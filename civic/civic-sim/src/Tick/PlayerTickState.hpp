// Ticket: 0002_player_tick_state

#ifndef CIVIC_SIM_TICK_PLAYER_TICK_STATE_HPP
#define CIVIC_SIM_TICK_PLAYER_TICK_STATE_HPP

#include <cstdint>
#include <map>
#include <string>

#include "civic-sim/src/DataTypes/GameTime.hpp"
#include "civic-sim/src/Tick/TickRecord.hpp"

namespace civic_sim
{

/**
 * @brief Per-system progress for one player
 */
struct SystemTickState
{
  GameTime lastProcessed;
  std::map<std::string, uint32_t> counters;  // "processed": advances applied
};

/**
 * @brief Last globally-processed tick for one player
 *
 * A player is "caught up" when lastProcessedTick equals the latest completed
 * tick and "lagging" otherwise. Invariant:
 *   lastProcessedTick.totalMonths <= latest completed tick totalMonths
 *
 * @ticket 0002_player_tick_state
 */
struct PlayerTickState
{
  std::string playerId;
  GameTime lastProcessedTick;
  WallClock::time_point lastProcessedAt{};
  std::map<std::string, SystemTickState> perSystemState;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_TICK_PLAYER_TICK_STATE_HPP
