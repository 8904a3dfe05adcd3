// Ticket: 0001_tick_scheduler
// Purpose: Per-tick orchestration overhead as the player count grows

#include <benchmark/benchmark.h>
#include <memory>
#include <string>

#include <spdlog/sinks/null_sink.h>

#include "civic-sim/src/Persistence/MemoryTickStore.hpp"
#include "civic-sim/src/TickEngine.hpp"

using namespace civic_sim;

namespace
{

// Counts players; stands in for a cheap game system
class CountingProcessor final : public TickProcessor
{
public:
  explicit CountingProcessor(std::string name) : name_{std::move(name)}
  {
  }

  std::string_view name() const override
  {
    return name_;
  }

  ProcessorOutcome process(const ProcessorOptions&,
                           std::span<const std::string> playerIds) override
  {
    return ProcessorOutcome{static_cast<uint32_t>(playerIds.size()), {}};
  }

private:
  std::string name_;
};

}  // namespace

static void BM_RunTick(benchmark::State& state)
{
  auto const playerCount = static_cast<size_t>(state.range(0));
  auto const workers = static_cast<unsigned>(state.range(1));

  for (auto _ : state)
  {
    state.PauseTiming();
    MemoryTickStore store;
    TickEngine::Config config{};
    config.logger = std::make_shared<spdlog::logger>(
      "bench", std::make_shared<spdlog::sinks::null_sink_mt>());
    config.workerThreads = workers;
    config.batchSize = 128;
    TickEngine engine{store, config};
    engine.registerProcessor(std::make_unique<CountingProcessor>("banking"));
    engine.registerProcessor(std::make_unique<CountingProcessor>("elections"));
    for (size_t i = 0; i < playerCount; ++i)
    {
      engine.registerPlayer("player-" + std::to_string(i));
    }
    state.ResumeTiming();

    auto record = engine.runTick();
    benchmark::DoNotOptimize(record);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(playerCount));
}
BENCHMARK(BM_RunTick)
  ->Args({100, 1})
  ->Args({1000, 1})
  ->Args({10000, 1})
  ->Args({10000, 4})
  ->Unit(benchmark::kMillisecond);
