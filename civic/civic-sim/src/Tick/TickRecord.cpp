#include "civic-sim/src/Tick/TickRecord.hpp"

#include <utility>

namespace civic_sim
{

void applyResult(TickRecord& record,
                 TickResult result,
                 WallClock::time_point completedAt)
{
  record.completedAt = completedAt;
  record.durationMs =
    std::chrono::duration<double, std::milli>(completedAt - record.startedAt)
      .count();

  record.processorsRun.clear();
  record.totalItemsProcessed = 0;
  record.totalErrors = 0;
  bool allSucceeded = true;
  for (const auto& processor : result.processors)
  {
    record.processorsRun.push_back(processor.processor);
    record.totalItemsProcessed += processor.itemsProcessed;
    record.totalErrors += static_cast<uint32_t>(processor.errors.size());
    allSucceeded = allSucceeded && processor.success;
  }
  record.success =
    allSucceeded && !result.timedOut && result.failureReason.empty();
  record.result = std::move(result);
}

std::string_view toString(TickTrigger trigger)
{
  switch (trigger)
  {
    case TickTrigger::Scheduled:
      return "Scheduled";
    case TickTrigger::Manual:
      return "Manual";
    case TickTrigger::Catchup:
      return "Catchup";
  }
  return "Unknown";
}

std::string_view toString(TickStatus status)
{
  switch (status)
  {
    case TickStatus::Running:
      return "Running";
    case TickStatus::Completed:
      return "Completed";
    case TickStatus::Failed:
      return "Failed";
  }
  return "Unknown";
}

}  // namespace civic_sim
