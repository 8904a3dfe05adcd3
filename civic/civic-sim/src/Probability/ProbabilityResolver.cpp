// Ticket: 0003_probability_resolver

#include "civic-sim/src/Probability/ProbabilityResolver.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include "civic-sim/src/Randomness/DeterministicRandom.hpp"
#include "civic-sim/src/Utils/Errors.hpp"

namespace civic_sim
{

namespace
{

void requireFinite(double value, std::string_view name)
{
  if (!std::isfinite(value))
  {
    throw ValidationError{std::format("{} must be finite", name)};
  }
}

void requireNonNegative(double value, std::string_view name)
{
  requireFinite(value, name);
  if (value < 0.0)
  {
    throw ValidationError{
      std::format("{} must be non-negative, got {}", name, value)};
  }
}

void requirePositive(double value, std::string_view name)
{
  requireFinite(value, name);
  if (value <= 0.0)
  {
    throw ValidationError{
      std::format("{} must be positive, got {}", name, value)};
  }
}

void requireUnit(double value, std::string_view name)
{
  requireFinite(value, name);
  if (value < 0.0 || value > 1.0)
  {
    throw ValidationError{
      std::format("{} must be within [0, 1], got {}", name, value)};
  }
}

}  // namespace

// ========== Config ==========

ProbabilityResolver::Config ProbabilityResolver::Config::lobbying()
{
  Config config{};
  config.tierBase = {{"LOCAL", 0.30}, {"STATE", 0.20}, {"FEDERAL", 0.10}};
  return config;
}

ProbabilityResolver::Config ProbabilityResolver::Config::research()
{
  Config config{};
  config.tierBase = {{"BASIC", 0.40}, {"APPLIED", 0.25}, {"FRONTIER", 0.08}};
  // Research budgets are larger and deadlines are milestones, not elections
  config.spendScale = 250000.0;
  config.spendWeight = 0.35;
  config.influenceWeight = 0.05;
  config.proximityWeight = 0.10;
  config.proximityHalfLife = 8.0;
  config.compositeFactor = 0.25;
  config.reputationModel = ReputationModel::Linear;
  config.reputationWeight = 0.05;
  config.priorSuccessBase = 0.03;
  config.priorSuccessDecay = 0.6;
  config.priorSuccessCap = 0.08;
  config.jitterRange = 0.03;
  config.jitterSpendThreshold = 5000.0;
  config.softMax = 0.80;
  config.easingFactor = 0.25;
  config.minProbability = 0.02;
  config.maxProbability = 0.90;
  return config;
}

void ProbabilityResolver::Config::validate() const
{
  if (tierBase.empty())
  {
    throw ValidationError{"ProbabilityResolver tier table is empty"};
  }
  for (const auto& [tier, base] : tierBase)
  {
    requireUnit(base, std::format("tier base '{}'", tier));
  }

  requirePositive(spendScale, "spendScale");
  requireNonNegative(spendWeight, "spendWeight");
  requirePositive(influenceScale, "influenceScale");
  requireNonNegative(influenceWeight, "influenceWeight");
  requireNonNegative(proximityWeight, "proximityWeight");
  requirePositive(proximityHalfLife, "proximityHalfLife");
  requireNonNegative(compositeFactor, "compositeFactor");

  requireNonNegative(reputationWeight, "reputationWeight");
  requireNonNegative(reputationSteepness, "reputationSteepness");
  requireFinite(reputationMidpoint, "reputationMidpoint");

  requireNonNegative(priorSuccessBase, "priorSuccessBase");
  requireUnit(priorSuccessDecay, "priorSuccessDecay");
  requireNonNegative(priorSuccessCap, "priorSuccessCap");

  requireFinite(economicMin, "economicMin");
  requireFinite(economicMax, "economicMax");
  if (economicMin > 0.0 || economicMax < 0.0)
  {
    throw ValidationError{std::format(
      "economic range must straddle zero, got [{}, {}]", economicMin,
      economicMax)};
  }

  requireNonNegative(jitterRange, "jitterRange");
  requireNonNegative(jitterSpendThreshold, "jitterSpendThreshold");

  requireUnit(minProbability, "minProbability");
  requireUnit(maxProbability, "maxProbability");
  if (minProbability > maxProbability)
  {
    throw ValidationError{std::format(
      "minProbability {} exceeds maxProbability {}", minProbability,
      maxProbability)};
  }
  requireFinite(softMax, "softMax");
  requireUnit(easingFactor, "easingFactor");
}

// ========== ProbabilityResolver ==========

ProbabilityResolver::ProbabilityResolver(Config config)
  : config_{std::move(config)}
{
  config_.validate();
}

ProbabilityResolver::NormalizedInputs ProbabilityResolver::normalize(
  const Inputs& inputs) const
{
  auto const tierIt = config_.tierBase.find(inputs.tier);
  if (tierIt == config_.tierBase.end())
  {
    throw ValidationError{
      std::format("Unknown difficulty tier '{}'", inputs.tier)};
  }

  requireNonNegative(inputs.spend, "spend");
  requireNonNegative(inputs.influence, "influence");
  requireFinite(inputs.reputation, "reputation");
  requireFinite(inputs.compositeWeight, "compositeWeight");
  requireNonNegative(inputs.timeToEvent, "timeToEvent");

  NormalizedInputs normalized{};
  normalized.base = tierIt->second;
  normalized.spend = inputs.spend;
  normalized.influence = inputs.influence;
  normalized.reputation = std::clamp(inputs.reputation, 0.0, 100.0);
  normalized.compositeWeight = std::clamp(inputs.compositeWeight, 0.0, 1.0);
  normalized.timeToEvent = inputs.timeToEvent;
  normalized.hasSeed = inputs.seed.has_value();
  normalized.seed = inputs.seed.value_or(std::string{});
  normalized.priorSuccessCount = inputs.priorSuccessCount.value_or(0U);

  double const economic = inputs.economicCondition.value_or(0.0);
  requireFinite(economic, "economicCondition");
  normalized.economicCondition = std::clamp(economic, -1.0, 1.0);

  return normalized;
}

ProbabilityBreakdown ProbabilityResolver::resolve(const Inputs& inputs) const
{
  return resolve(normalize(inputs));
}

ProbabilityBreakdown ProbabilityResolver::resolve(
  const NormalizedInputs& inputs) const
{
  ProbabilityBreakdown b{};
  b.base = inputs.base;

  // Diminishing returns on money
  b.spendTerm =
    std::log10(1.0 + inputs.spend / config_.spendScale) * config_.spendWeight;

  // Hard plateau on influence
  b.influenceTerm =
    std::clamp(inputs.influence / config_.influenceScale, 0.0, 1.0) *
    config_.influenceWeight;

  b.proximityMultiplier =
    1.0 + config_.proximityWeight *
            std::exp(-inputs.timeToEvent / config_.proximityHalfLife);

  b.compositeContribution =
    1.0 + std::clamp(inputs.compositeWeight, 0.0, 1.0) *
            config_.compositeFactor;

  b.core = b.base * (1.0 + b.spendTerm) * (1.0 + b.influenceTerm) *
           b.compositeContribution * b.proximityMultiplier;

  b.reputationTerm = reputationTerm(inputs.reputation);
  b.priorSuccessBonus = priorSuccessBonus(inputs.priorSuccessCount);
  b.economicModifier = economicModifier(inputs.economicCondition);

  if (inputs.hasSeed && inputs.spend > config_.jitterSpendThreshold)
  {
    b.jitter = deterministic::normalized(inputs.seed) * config_.jitterRange;
  }

  b.raw = b.core + b.reputationTerm + b.priorSuccessBonus +
          b.economicModifier + b.jitter;
  b.softened = softEase(b.raw);
  // std::clamp passes NaN through unchanged
  b.finalProbability =
    std::isnan(b.softened)
      ? config_.minProbability
      : std::clamp(b.softened, config_.minProbability, config_.maxProbability);
  return b;
}

double ProbabilityResolver::priorSuccessBonus(uint32_t priorSuccessCount) const
{
  // Closed form of base + base*decay + ... + base*decay^(n-1)
  double const n = static_cast<double>(priorSuccessCount);
  double const decay = config_.priorSuccessDecay;
  double const sum =
    decay == 1.0 ? config_.priorSuccessBase * n
                 : config_.priorSuccessBase * (1.0 - std::pow(decay, n)) /
                     (1.0 - decay);
  return std::min(sum, config_.priorSuccessCap);
}

double ProbabilityResolver::reputationTerm(double reputation) const
{
  if (config_.reputationModel == ReputationModel::Linear)
  {
    return std::clamp(reputation, 0.0, 100.0) / 100.0 *
           config_.reputationWeight;
  }
  return config_.reputationWeight /
         (1.0 + std::exp(-config_.reputationSteepness *
                         (reputation - config_.reputationMidpoint)));
}

double ProbabilityResolver::economicModifier(double economicCondition) const
{
  double const signal = std::clamp(economicCondition, -1.0, 1.0);
  // economicMin is negative: a negative signal maps onto [economicMin, 0]
  return signal >= 0.0 ? signal * config_.economicMax
                       : -signal * config_.economicMin;
}

double ProbabilityResolver::softEase(double raw) const
{
  if (raw <= config_.softMax)
  {
    return raw;
  }
  return config_.softMax + (raw - config_.softMax) * config_.easingFactor;
}

bool ProbabilityResolver::roll(double probability, std::string_view seed)
{
  return deterministic::unitInterval(seed) < probability;
}

DiscoveryTier ProbabilityResolver::classifyDiscovery(
  double probability,
  std::string_view seed,
  const DiscoveryThresholds& thresholds)
{
  double const u = deterministic::unitInterval(seed);
  if (probability <= 0.0 || u >= probability)
  {
    return DiscoveryTier::None;
  }

  double const quality = 1.0 - u / probability;
  if (quality >= thresholds.breakthrough)
  {
    return DiscoveryTier::Breakthrough;
  }
  if (quality >= thresholds.significant)
  {
    return DiscoveryTier::Significant;
  }
  return DiscoveryTier::Incremental;
}

std::string_view toString(DiscoveryTier tier)
{
  switch (tier)
  {
    case DiscoveryTier::None:
      return "None";
    case DiscoveryTier::Incremental:
      return "Incremental";
    case DiscoveryTier::Significant:
      return "Significant";
    case DiscoveryTier::Breakthrough:
      return "Breakthrough";
  }
  return "Unknown";
}

}  // namespace civic_sim
