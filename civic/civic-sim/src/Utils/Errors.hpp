#ifndef CIVIC_SIM_UTILS_ERRORS_HPP
#define CIVIC_SIM_UTILS_ERRORS_HPP

#include <stdexcept>
#include <cstdint>
#include <string>
#include <utility>

namespace civic_sim
{

/**
 * @brief Malformed GameTime or out-of-range formula input
 *
 * Raised at function boundaries before any state is mutated.
 */
class ValidationError final : public std::invalid_argument
{
public:
  explicit ValidationError(const std::string& message)
    : std::invalid_argument(message)
  {
  }
};

/**
 * @brief Game time moved backward or disagrees with the last completed tick
 *
 * Fatal. Requires operator intervention; the engine never retries.
 */
class ClockDriftError final : public std::runtime_error
{
public:
  ClockDriftError(const std::string& message,
                  uint32_t lastCompletedMonths,
                  uint32_t attemptedMonths)
    : std::runtime_error(message),
      lastCompletedMonths_{lastCompletedMonths},
      attemptedMonths_{attemptedMonths}
  {
  }

  uint32_t lastCompletedMonths() const
  {
    return lastCompletedMonths_;
  }

  uint32_t attemptedMonths() const
  {
    return attemptedMonths_;
  }

private:
  uint32_t lastCompletedMonths_;
  uint32_t attemptedMonths_;
};

/**
 * @brief A tick start was attempted while another tick is Running, or the
 * tick id is already taken
 *
 * Callers retry on the next trigger.
 */
class ConcurrentTickError final : public std::runtime_error
{
public:
  ConcurrentTickError(const std::string& message, std::string conflictingTickId)
    : std::runtime_error(message),
      conflictingTickId_{std::move(conflictingTickId)}
  {
  }

  const std::string& conflictingTickId() const
  {
    return conflictingTickId_;
  }

private:
  std::string conflictingTickId_;
};

}  // namespace civic_sim

#endif  // CIVIC_SIM_UTILS_ERRORS_HPP
