// Ticket: 0003_probability_resolver

#include "civic-sim/src/Randomness/DeterministicRandom.hpp"

#include <limits>

namespace civic_sim::deterministic
{

namespace
{

constexpr double kHashRange =
  static_cast<double>(std::numeric_limits<uint32_t>::max());

}  // namespace

double normalized(std::string_view seed)
{
  return static_cast<double>(hash(seed)) / kHashRange * 2.0 - 1.0;
}

double unitInterval(std::string_view seed)
{
  return static_cast<double>(hash(seed)) / kHashRange;
}

std::string composeSeed(std::initializer_list<std::string_view> parts)
{
  std::string seed;
  bool first = true;
  for (auto const part : parts)
  {
    if (!first)
    {
      seed += kSeedSeparator;
    }
    seed.append(part);
    first = false;
  }
  return seed;
}

}  // namespace civic_sim::deterministic
