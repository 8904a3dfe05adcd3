// Ticket: 0001_tick_scheduler

#include "civic-sim/src/DataTypes/GameTime.hpp"

#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{

GameTime GameTime::fromTotalMonths(uint32_t totalMonths)
{
  if (totalMonths == 0)
  {
    return zero();
  }
  return GameTime{(totalMonths - 1) / kMonthsPerYear + 1,
                  (totalMonths - 1) % kMonthsPerYear + 1,
                  totalMonths};
}

void GameTime::validate() const
{
  if (isZero())
  {
    return;
  }
  if (month < 1 || month > kMonthsPerYear)
  {
    throw ValidationError{
      std::format("GameTime month {} outside 1..12 ({})", month, toString())};
  }
  if (year < 1)
  {
    throw ValidationError{
      std::format("GameTime year must be >= 1 ({})", toString())};
  }
  uint64_t const expected =
    static_cast<uint64_t>(year - 1) * kMonthsPerYear + month;
  if (expected != totalMonths)
  {
    throw ValidationError{std::format(
      "GameTime {} inconsistent: year/month imply totalMonths {}",
      toString(),
      expected)};
  }
}

GameTime GameTime::advancedBy(uint32_t months) const
{
  return fromTotalMonths(totalMonths + months);
}

}  // namespace civic_sim
