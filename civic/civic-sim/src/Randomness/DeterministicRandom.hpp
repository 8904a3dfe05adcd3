// Ticket: 0003_probability_resolver

#ifndef CIVIC_SIM_RANDOMNESS_DETERMINISTIC_RANDOM_HPP
#define CIVIC_SIM_RANDOMNESS_DETERMINISTIC_RANDOM_HPP

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace civic_sim
{

/**
 * @brief Seed-derived, reproducible pseudo-randomness
 *
 * All functions are pure: identical seed strings produce bit-identical output
 * across processes, platforms and time. Stochastic game formulas depend on
 * this to be replayable for audits and tests.
 *
 * Seeds are composite strings built by callers (e.g. "playerId|action|amount")
 * so that changing any component changes the output.
 *
 * @ticket 0003_probability_resolver
 */
namespace deterministic
{

inline constexpr uint32_t kFnvOffsetBasis = 2166136261U;
inline constexpr uint32_t kFnvPrime = 16777619U;
inline constexpr char kSeedSeparator = '|';

/**
 * @brief 32-bit FNV-1a hash of the seed bytes
 */
constexpr uint32_t hash(std::string_view seed)
{
  uint32_t h = kFnvOffsetBasis;
  for (char const c : seed)
  {
    h ^= static_cast<uint8_t>(c);
    h *= kFnvPrime;
  }
  return h;
}

/**
 * @brief Map the seed hash linearly onto [-1, 1]
 */
double normalized(std::string_view seed);

/**
 * @brief Map the seed hash linearly onto [0, 1]
 *
 * Used for deterministic success rolls against a probability.
 */
double unitInterval(std::string_view seed);

/**
 * @brief Join seed components with '|'
 */
std::string composeSeed(std::initializer_list<std::string_view> parts);

}  // namespace deterministic

}  // namespace civic_sim

#endif  // CIVIC_SIM_RANDOMNESS_DETERMINISTIC_RANDOM_HPP
