// Ticket: 0003_probability_resolver
// Purpose: Cost of one resolve() call on the lobbying and research hot paths

#include <benchmark/benchmark.h>
#include <random>
#include <string>
#include <vector>

#include "civic-sim/src/Probability/ProbabilityResolver.hpp"
#include "civic-sim/src/Randomness/DeterministicRandom.hpp"

using namespace civic_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

std::vector<ProbabilityResolver::Inputs> generateInputs(const std::string& tier,
                                                        size_t count)
{
  std::mt19937 rng{42};
  std::uniform_real_distribution<double> spendDist{0.0, 1.0e6};
  std::uniform_real_distribution<double> influenceDist{0.0, 200.0};
  std::uniform_real_distribution<double> reputationDist{0.0, 100.0};
  std::uniform_real_distribution<double> unitDist{0.0, 1.0};
  std::uniform_real_distribution<double> weeksDist{0.0, 52.0};
  std::uniform_int_distribution<uint32_t> priorDist{0, 10};

  std::vector<ProbabilityResolver::Inputs> inputs(count);
  for (size_t i = 0; i < count; ++i)
  {
    auto& in = inputs[i];
    in.tier = tier;
    in.spend = spendDist(rng);
    in.influence = influenceDist(rng);
    in.reputation = reputationDist(rng);
    in.compositeWeight = unitDist(rng);
    in.timeToEvent = weeksDist(rng);
    in.priorSuccessCount = priorDist(rng);
    in.economicCondition = unitDist(rng) * 2.0 - 1.0;
    in.seed = deterministic::composeSeed(
      {"player-" + std::to_string(i % 97), "lobby", std::to_string(in.spend)});
  }
  return inputs;
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

static void BM_Resolve_Lobbying(benchmark::State& state)
{
  ProbabilityResolver const resolver{ProbabilityResolver::Config::lobbying()};
  auto const inputs = generateInputs("STATE", 1024);

  size_t i = 0;
  for (auto _ : state)
  {
    auto breakdown = resolver.resolve(inputs[i++ % inputs.size()]);
    benchmark::DoNotOptimize(breakdown);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Resolve_Lobbying);

static void BM_Resolve_Research(benchmark::State& state)
{
  ProbabilityResolver const resolver{ProbabilityResolver::Config::research()};
  auto const inputs = generateInputs("FRONTIER", 1024);

  size_t i = 0;
  for (auto _ : state)
  {
    auto breakdown = resolver.resolve(inputs[i++ % inputs.size()]);
    benchmark::DoNotOptimize(breakdown);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Resolve_Research);

// Boundary validation alone, without the formula
static void BM_Normalize(benchmark::State& state)
{
  ProbabilityResolver const resolver{ProbabilityResolver::Config::lobbying()};
  auto const inputs = generateInputs("LOCAL", 1024);

  size_t i = 0;
  for (auto _ : state)
  {
    auto normalized = resolver.normalize(inputs[i++ % inputs.size()]);
    benchmark::DoNotOptimize(normalized);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Normalize);

static void BM_DeterministicHash(benchmark::State& state)
{
  std::string const seed = "player-1234|lobby|federal|250000";
  for (auto _ : state)
  {
    benchmark::DoNotOptimize(deterministic::hash(seed));
  }
}
BENCHMARK(BM_DeterministicHash);
