// Ticket: 0002_player_tick_state

#ifndef CIVIC_TRANSFER_PLAYER_TICK_PROGRESS_RECORD_HPP
#define CIVIC_TRANSFER_PLAYER_TICK_PROGRESS_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <string>

namespace civic_transfer
{

/**
 * @brief Journal entry recording that a system advanced a player
 *
 * PlayerTickState is rebuilt by folding these entries: for each
 * (player_id, system) pair the entry with the greatest total_months wins, and
 * the player's lastProcessedTick is the greatest total_months over all of the
 * player's systems. Entries are never updated in place, so a late writer can
 * not move a player backward.
 *
 * @ticket 0002_player_tick_state
 */
struct PlayerTickProgressRecord : public cpp_sqlite::BaseTransferObject
{
  std::string player_id;
  std::string system;           // Processor name that advanced the player
  uint32_t year{0};
  uint32_t month{0};
  uint32_t total_months{0};
  double processed_at{0.0};     // Wall clock [seconds since epoch]
  uint32_t processed_count{0};  // Value of the system's "processed" counter
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(PlayerTickProgressRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (player_id,
                       system,
                       year,
                       month,
                       total_months,
                       processed_at,
                       processed_count));

}  // namespace civic_transfer

#endif  // CIVIC_TRANSFER_PLAYER_TICK_PROGRESS_RECORD_HPP
