// Ticket: 0001_tick_scheduler

#include "civic-sim/src/Tick/TickScheduler.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{

TickScheduler::TickScheduler(TickStore& store)
  : TickScheduler{store, Config{}}
{
}

TickScheduler::TickScheduler(TickStore& store, Config config, Clock clock)
  : store_{store}, config_{config}, clock_{std::move(clock)}
{
  if (!clock_)
  {
    clock_ = []() { return WallClock::now(); };
  }

  history_ = store_.loadTickRecords();
  for (size_t i = 0; i < history_.size(); ++i)
  {
    if (!history_[i].isRunning())
    {
      continue;
    }
    if (activeIndex_)
    {
      throw std::runtime_error{"Stored history has more than one running tick: '" +
                               history_[*activeIndex_].tickId + "' and '" +
                               history_[i].tickId + "'"};
    }
    activeIndex_ = i;
  }
}

std::string TickScheduler::tickIdFor(const GameTime& gameTime)
{
  return std::format("tick-{:06}", gameTime.totalMonths);
}

GameTime TickScheduler::getCurrentGameTime() const
{
  std::scoped_lock lock{mutex_};
  const TickRecord* last = lastCompletedLocked();
  return last != nullptr ? last->gameTime : GameTime::start();
}

GameTime TickScheduler::getNextGameTime() const
{
  std::scoped_lock lock{mutex_};
  const TickRecord* last = lastCompletedLocked();
  return last != nullptr ? last->gameTime.advancedBy(1) : GameTime::start();
}

TickRecord TickScheduler::recordTick(const std::string& tickId,
                                     const GameTime& gameTime,
                                     TickTrigger triggeredBy,
                                     std::optional<std::string> triggeredByUserId)
{
  gameTime.validate();
  if (gameTime.isZero())
  {
    throw ValidationError{"Cannot start a tick at the zero game time"};
  }
  if (tickId.empty())
  {
    throw ValidationError{"Tick id must not be empty"};
  }

  std::scoped_lock lock{mutex_};

  auto const duplicate =
    std::ranges::any_of(history_,
                        [&](const TickRecord& record)
                        { return record.tickId == tickId; });
  if (duplicate)
  {
    throw ConcurrentTickError{"Tick '" + tickId + "' already exists", tickId};
  }

  if (activeIndex_)
  {
    const TickRecord& active = history_[*activeIndex_];
    throw ConcurrentTickError{"Tick '" + active.tickId +
                                "' is still running; cannot start '" + tickId +
                                "'",
                              active.tickId};
  }

  const TickRecord* last = lastCompletedLocked();
  if (last != nullptr && gameTime <= last->gameTime)
  {
    throw ClockDriftError{"Tick '" + tickId + "' at " + gameTime.toString() +
                            " is not after the last completed tick at " +
                            last->gameTime.toString(),
                          last->gameTime.totalMonths,
                          gameTime.totalMonths};
  }

  TickRecord record{};
  record.tickId = tickId;
  record.gameTime = gameTime;
  record.triggeredBy = triggeredBy;
  record.triggeredByUserId = std::move(triggeredByUserId);
  record.startedAt = clock_();

  store_.saveTickStart(record);
  history_.push_back(record);
  activeIndex_ = history_.size() - 1;
  return record;
}

TickRecord TickScheduler::completeTick(const std::string& tickId,
                                       TickResult result)
{
  std::scoped_lock lock{mutex_};

  auto const it = std::ranges::find_if(history_,
                                       [&](const TickRecord& record)
                                       { return record.tickId == tickId; });
  if (it == history_.end())
  {
    throw ValidationError{"Unknown tick '" + tickId + "'"};
  }
  if (!it->isRunning())
  {
    throw ValidationError{"Tick '" + tickId + "' is already completed"};
  }

  return completeLocked(static_cast<size_t>(it - history_.begin()),
                        std::move(result));
}

uint32_t TickScheduler::getMissedTicks(const GameTime& expected) const
{
  std::scoped_lock lock{mutex_};
  const TickRecord* last = lastCompletedLocked();
  uint32_t const lastMonths = last != nullptr ? last->gameTime.totalMonths : 0;
  if (expected.totalMonths <= lastMonths + 1)
  {
    return 0;
  }
  return expected.totalMonths - lastMonths - 1;
}

std::optional<TickRecord> TickScheduler::getActiveTick() const
{
  std::scoped_lock lock{mutex_};
  if (!activeIndex_)
  {
    return std::nullopt;
  }
  return history_[*activeIndex_];
}

std::optional<TickRecord> TickScheduler::getLastCompletedTick() const
{
  std::scoped_lock lock{mutex_};
  const TickRecord* last = lastCompletedLocked();
  if (last == nullptr)
  {
    return std::nullopt;
  }
  return *last;
}

uint32_t TickScheduler::completedTickCount() const
{
  std::scoped_lock lock{mutex_};
  return static_cast<uint32_t>(std::ranges::count_if(
    history_, [](const TickRecord& record) { return !record.isRunning(); }));
}

std::vector<TickRecord> TickScheduler::history() const
{
  std::scoped_lock lock{mutex_};
  return history_;
}

std::optional<TickRecord> TickScheduler::recoverStuckTick()
{
  std::scoped_lock lock{mutex_};
  if (!activeIndex_)
  {
    return std::nullopt;
  }

  const TickRecord& active = history_[*activeIndex_];
  auto const elapsed = clock_() - active.startedAt;
  if (elapsed <= config_.tickTimeout)
  {
    return std::nullopt;
  }

  TickResult result{};
  result.timedOut = true;
  result.failureReason = std::format(
    "Tick exceeded timeout of {} ms", config_.tickTimeout.count());
  return completeLocked(*activeIndex_, std::move(result));
}

TickRecord TickScheduler::forceCompleteTick(const std::string& tickId,
                                            const std::string& reason)
{
  TickResult result{};
  result.forcedByOperator = true;
  result.failureReason =
    reason.empty() ? std::string{"Forced completion by operator"} : reason;
  return completeTick(tickId, std::move(result));
}

TickRecord TickScheduler::completeLocked(size_t index, TickResult result)
{
  TickRecord completed = history_[index];
  applyResult(completed, std::move(result), clock_());

  store_.saveTickCompletion(completed);
  history_[index] = completed;
  if (activeIndex_ == index)
  {
    activeIndex_.reset();
  }
  return completed;
}

const TickRecord* TickScheduler::lastCompletedLocked() const
{
  const TickRecord* last = nullptr;
  for (const auto& record : history_)
  {
    if (record.isRunning())
    {
      continue;
    }
    if (last == nullptr || record.gameTime > last->gameTime)
    {
      last = &record;
    }
  }
  return last;
}

}  // namespace civic_sim
