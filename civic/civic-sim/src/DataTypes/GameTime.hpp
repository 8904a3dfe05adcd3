// Ticket: 0001_tick_scheduler

#ifndef CIVIC_SIM_DATA_TYPES_GAME_TIME_HPP
#define CIVIC_SIM_DATA_TYPES_GAME_TIME_HPP

#include <compare>
#include <cstdint>
#include <format>
#include <string>

namespace civic_sim
{

/**
 * @brief Simulated calendar position
 *
 * totalMonths is the canonical, monotonic tick index. year and month are
 * display fields derived from it:
 *   year  = (totalMonths - 1) / 12 + 1
 *   month = (totalMonths - 1) % 12 + 1
 *
 * The all-zero value is the "never processed" sentinel used by new player
 * records. Ordering compares totalMonths only.
 *
 * @ticket 0001_tick_scheduler
 */
struct GameTime
{
  uint32_t year{0};
  uint32_t month{0};
  uint32_t totalMonths{0};

  static constexpr uint32_t kMonthsPerYear = 12;

  /**
   * @brief Build a consistent GameTime from the canonical index
   * @param totalMonths Tick index (0 yields the zero sentinel)
   */
  static GameTime fromTotalMonths(uint32_t totalMonths);

  /// @brief First month of the game, {1, 1, 1}
  static GameTime start()
  {
    return fromTotalMonths(1);
  }

  /// @brief Zero sentinel, {0, 0, 0}
  static GameTime zero()
  {
    return GameTime{};
  }

  [[nodiscard]] bool isZero() const
  {
    return totalMonths == 0 && year == 0 && month == 0;
  }

  /**
   * @brief Check month range and year/month/totalMonths consistency
   * @throws ValidationError if the value is neither the zero sentinel nor a
   * consistent calendar position
   */
  void validate() const;

  /// @brief GameTime advanced by the given number of months
  [[nodiscard]] GameTime advancedBy(uint32_t months) const;

  [[nodiscard]] std::string toString() const
  {
    return std::format("Y{}-M{:02} (#{})", year, month, totalMonths);
  }

  friend bool operator==(const GameTime& lhs, const GameTime& rhs)
  {
    return lhs.totalMonths == rhs.totalMonths;
  }

  friend std::strong_ordering operator<=>(const GameTime& lhs,
                                          const GameTime& rhs)
  {
    return lhs.totalMonths <=> rhs.totalMonths;
  }
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_DATA_TYPES_GAME_TIME_HPP
