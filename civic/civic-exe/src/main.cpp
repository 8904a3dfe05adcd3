// Ticket: 0005_sqlite_tick_store

#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "civic-exe/src/CommandLine.hpp"
#include "civic-sim/src/Persistence/MemoryTickStore.hpp"
#include "civic-sim/src/Persistence/SqliteTickStore.hpp"
#include "civic-sim/src/Probability/ProbabilityResolver.hpp"
#include "civic-sim/src/TickEngine.hpp"
#include "civic-sim/src/Utils/Errors.hpp"

using namespace civic_sim;
using civic_sim::cli::parseCount;
using civic_sim::cli::parseDouble;

namespace
{

constexpr const char* kMemoryDatabase = ":memory:";

void printUsage()
{
  std::cerr
    << "Usage: civic_tick <database|:memory:> <command> [args]\n"
       "Commands:\n"
       "  status                          Show clock and last tick\n"
       "  register <playerId>             Track a player\n"
       "  tick [count] [--dry-run] [--force]\n"
       "                                  Run count manual ticks (default 1)\n"
       "  advance [secondsPerTick]        Scheduled trigger against wall clock\n"
       "  force-complete <tickId> [why]   Fail a stuck Running tick\n"
       "  history                         List every tick\n"
       "  resolve <lobbying|research> <tier> <spend> <influence> <reputation>\n"
       "          <composite> <timeToEvent> [seed]\n";
}

void printRecord(const TickRecord& record)
{
  std::cout << std::format("{}  {}  {:9}  {:9}  items={} errors={}",
                           record.tickId,
                           record.gameTime.toString(),
                           toString(record.triggeredBy),
                           toString(record.status()),
                           record.totalItemsProcessed,
                           record.totalErrors);
  if (record.result && !record.result->failureReason.empty())
  {
    std::cout << "  (" << record.result->failureReason << ")";
  }
  if (record.result && record.result->dryRun)
  {
    std::cout << "  [dry run]";
  }
  std::cout << "\n";
}

int runResolve(const std::vector<std::string>& args)
{
  if (args.size() < 7)
  {
    printUsage();
    return EXIT_FAILURE;
  }

  ProbabilityResolver::Config config;
  if (args[0] == "lobbying")
  {
    config = ProbabilityResolver::Config::lobbying();
  }
  else if (args[0] == "research")
  {
    config = ProbabilityResolver::Config::research();
  }
  else
  {
    throw ValidationError{"Unknown resolver preset '" + args[0] + "'"};
  }

  ProbabilityResolver const resolver{config};

  ProbabilityResolver::Inputs inputs;
  inputs.tier = args[1];
  inputs.spend = parseDouble(args[2], "spend");
  inputs.influence = parseDouble(args[3], "influence");
  inputs.reputation = parseDouble(args[4], "reputation");
  inputs.compositeWeight = parseDouble(args[5], "composite");
  inputs.timeToEvent = parseDouble(args[6], "timeToEvent");
  if (args.size() > 7)
  {
    inputs.seed = args[7];
  }

  auto const b = resolver.resolve(inputs);
  std::cout << std::format("base                {:.6f}\n"
                           "spendTerm           {:.6f}\n"
                           "influenceTerm       {:.6f}\n"
                           "composite           {:.6f}\n"
                           "proximity           {:.6f}\n"
                           "core                {:.6f}\n"
                           "reputationTerm      {:.6f}\n"
                           "priorSuccessBonus   {:.6f}\n"
                           "economicModifier    {:.6f}\n"
                           "jitter              {:.6f}\n"
                           "raw                 {:.6f}\n"
                           "softened            {:.6f}\n"
                           "final               {:.6f}\n",
                           b.base,
                           b.spendTerm,
                           b.influenceTerm,
                           b.compositeContribution,
                           b.proximityMultiplier,
                           b.core,
                           b.reputationTerm,
                           b.priorSuccessBonus,
                           b.economicModifier,
                           b.jitter,
                           b.raw,
                           b.softened,
                           b.finalProbability);
  return EXIT_SUCCESS;
}

int runEngineCommand(TickStore& store,
                     const std::string& command,
                     const std::vector<std::string>& args,
                     std::shared_ptr<spdlog::logger> logger)
{
  TickEngine::Config config;
  config.logger = std::move(logger);

  if (command == "advance")
  {
    TickSchedule schedule;
    schedule.realTimePerTick =
      std::chrono::seconds{args.empty() ? 3600 : parseCount(args[0])};
    // Epoch is the start of the first recorded tick
    auto const stored = store.loadTickRecords();
    schedule.epoch = stored.empty() ? WallClock::now() : stored.front().startedAt;
    config.schedule = schedule;
  }

  TickEngine engine{store, config};

  if (command == "status")
  {
    auto const state = engine.state();
    std::cout << "current game time: "
              << engine.getScheduler().getCurrentGameTime().toString() << "\n"
              << "ticks processed:   " << state.ticksProcessed << "\n"
              << "players tracked:   " << engine.getTracker().size() << "\n";
    if (auto active = engine.getScheduler().getActiveTick())
    {
      std::cout << "running tick:      " << active->tickId << "\n";
    }
    if (auto last = engine.getScheduler().getLastCompletedTick())
    {
      std::cout << "last tick:         ";
      printRecord(*last);
    }
    return EXIT_SUCCESS;
  }

  if (command == "register")
  {
    if (args.empty())
    {
      printUsage();
      return EXIT_FAILURE;
    }
    auto const state = engine.registerPlayer(args[0]);
    std::cout << state.playerId << " last processed "
              << state.lastProcessedTick.toString() << "\n";
    return EXIT_SUCCESS;
  }

  if (command == "tick")
  {
    auto const parsed = cli::parseTickArguments(args);
    TickRequest request{};
    request.dryRun = parsed.dryRun;
    request.force = parsed.force;
    for (uint32_t i = 0; i < parsed.count; ++i)
    {
      printRecord(engine.runTick(request));
    }
    return EXIT_SUCCESS;
  }

  if (command == "advance")
  {
    auto const record = engine.advanceTo(WallClock::now());
    if (!record)
    {
      std::cout << "up to date at "
                << engine.getScheduler().getCurrentGameTime().toString()
                << "\n";
      return EXIT_SUCCESS;
    }
    printRecord(*record);
    return EXIT_SUCCESS;
  }

  if (command == "force-complete")
  {
    if (args.empty())
    {
      printUsage();
      return EXIT_FAILURE;
    }
    printRecord(
      engine.forceCompleteTick(args[0], args.size() > 1 ? args[1] : ""));
    return EXIT_SUCCESS;
  }

  if (command == "history")
  {
    for (const auto& record : engine.getScheduler().history())
    {
      printRecord(record);
    }
    return EXIT_SUCCESS;
  }

  printUsage();
  return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc < 3)
  {
    printUsage();
    return EXIT_FAILURE;
  }

  std::string const database = argv[1];
  std::string const command = argv[2];
  std::vector<std::string> const args(argv + 3, argv + argc);

  auto logger = spdlog::stdout_color_mt("civic_tick");
  logger->set_level(spdlog::level::info);

  try
  {
    if (command == "resolve")
    {
      return runResolve(args);
    }

    if (database == kMemoryDatabase)
    {
      MemoryTickStore store;
      return runEngineCommand(store, command, args, logger);
    }
    SqliteTickStore store{database};
    return runEngineCommand(store, command, args, logger);
  }
  catch (const ClockDriftError& e)
  {
    logger->critical("{} (last completed #{}, attempted #{})",
                     e.what(),
                     e.lastCompletedMonths(),
                     e.attemptedMonths());
    return 2;
  }
  catch (const ConcurrentTickError& e)
  {
    logger->error("{}; retry once tick {} finishes",
                  e.what(),
                  e.conflictingTickId());
    return 3;
  }
  catch (const std::exception& e)
  {
    logger->error("{}", e.what());
    return EXIT_FAILURE;
  }
}
