// Ticket: 0005_sqlite_tick_store

#include "civic-exe/src/CommandLine.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{
namespace cli
{

double parseDouble(const std::string& text, const char* what)
{
  double value = 0.0;
  size_t consumed = 0;
  try
  {
    value = std::stod(text, &consumed);
  }
  catch (const std::logic_error&)
  {
    throw ValidationError{std::string{"Invalid "} + what + ": '" + text + "'"};
  }
  if (consumed != text.size())
  {
    throw ValidationError{std::string{"Trailing characters in "} + what};
  }
  if (!std::isfinite(value))
  {
    throw ValidationError{std::string{what} + " must be finite"};
  }
  return value;
}

uint32_t parseCount(const std::string& text)
{
  double const value = parseDouble(text, "count");
  // Range check first: casting an out-of-range double is undefined
  if (value < 1.0 ||
      value > static_cast<double>(std::numeric_limits<uint32_t>::max()) ||
      value != std::floor(value))
  {
    throw ValidationError{"Count must be a positive integer up to " +
                          std::to_string(std::numeric_limits<uint32_t>::max())};
  }
  return static_cast<uint32_t>(value);
}

TickArguments parseTickArguments(const std::vector<std::string>& args)
{
  TickArguments parsed{};
  std::optional<uint32_t> count;
  for (const auto& arg : args)
  {
    if (arg == "--dry-run")
    {
      parsed.dryRun = true;
    }
    else if (arg == "--force")
    {
      parsed.force = true;
    }
    else if (arg.starts_with("--"))
    {
      throw ValidationError{"Unknown tick option '" + arg + "'"};
    }
    else if (count)
    {
      throw ValidationError{"Tick count given twice"};
    }
    else
    {
      count = parseCount(arg);
    }
  }
  parsed.count = count.value_or(1U);
  return parsed;
}

}  // namespace cli
}  // namespace civic_sim
