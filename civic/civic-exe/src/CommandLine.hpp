// Ticket: 0005_sqlite_tick_store

#ifndef CIVIC_EXE_COMMAND_LINE_HPP
#define CIVIC_EXE_COMMAND_LINE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace civic_sim
{
namespace cli
{

/**
 * @brief Parsed arguments of the `tick` command
 */
struct TickArguments
{
  uint32_t count{1};
  bool dryRun{false};
  bool force{false};
};

/**
 * @brief Parse a finite number, rejecting trailing characters
 * @throws ValidationError naming `what` on malformed input
 */
double parseDouble(const std::string& text, const char* what);

/**
 * @brief Parse a positive integer count that fits in uint32_t
 * @throws ValidationError on zero, fractions, or out-of-range values
 */
uint32_t parseCount(const std::string& text);

/**
 * @brief Parse `[count] [--dry-run] [--force]` in any order
 * @throws ValidationError on an unknown flag or a second count
 */
TickArguments parseTickArguments(const std::vector<std::string>& args);

}  // namespace cli
}  // namespace civic_sim

#endif  // CIVIC_EXE_COMMAND_LINE_HPP
