// Ticket: 0003_probability_resolver

#ifndef CIVIC_SIM_PROBABILITY_PROBABILITY_RESOLVER_HPP
#define CIVIC_SIM_PROBABILITY_PROBABILITY_RESOLVER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace civic_sim
{

/// @brief Shape of the reputation contribution
enum class ReputationModel : uint8_t
{
  Linear,   ///< clamp(rep, 0, 100) / 100 * weight
  Logistic  ///< weight / (1 + exp(-steepness * (rep - midpoint)))
};

/// @brief Outcome tier for research discovery rolls
enum class DiscoveryTier : uint8_t
{
  None,
  Incremental,
  Significant,
  Breakthrough
};

/**
 * @brief Every stage of a resolved probability
 *
 * Audit value only: returned alongside the final probability so callers, UI
 * and tests can verify each term. Never persisted as authoritative state.
 */
struct ProbabilityBreakdown
{
  double base{0.0};                   // Difficulty base for the tier
  double spendTerm{0.0};              // log10(1 + spend/scale) * weight
  double influenceTerm{0.0};          // Plateaued influence contribution
  double compositeContribution{1.0};  // 1 + composite * factor
  double proximityMultiplier{1.0};    // 1 + weight * exp(-t/halfLife)
  double core{0.0};                   // Multiplicative core
  double reputationTerm{0.0};
  double priorSuccessBonus{0.0};
  double economicModifier{0.0};
  double jitter{0.0};
  double raw{0.0};                    // core + additive terms
  double softened{0.0};               // raw after soft easing
  double finalProbability{0.0};       // softened clamped to [min, max]
};

/**
 * @brief Generic weighted-formula probability engine
 *
 * Turns game-state inputs into a bounded success probability plus a full
 * ProbabilityBreakdown. The same resolver serves lobbying success, research
 * breakthroughs and discovery tiers; callers select behaviour through Config
 * only.
 *
 * Algorithm:
 * 1. spendTerm      = log10(1 + spend/spendScale) * spendWeight
 * 2. influenceTerm  = clamp(influence/influenceScale, 0, 1) * influenceWeight
 * 3. proximity      = 1 + proximityWeight * exp(-timeToEvent/halfLife)
 * 4. composite      = 1 + clamp(compositeWeight, 0, 1) * compositeFactor
 * 5. core           = base * (1+spendTerm) * (1+influenceTerm) * composite
 *                     * proximity
 * 6. reputation     = linear or logistic (logistic by default)
 * 7. priorBonus     = min(cap, sum_{i<n} priorBase * decay^i)
 * 8. economic       = s >= 0 ? s * economicMax : -s * economicMin
 * 9. jitter         = normalized(seed) * jitterRange when spend > threshold
 * 10. raw           = core + reputation + priorBonus + economic + jitter
 * 11. softened      = raw > softMax ? softMax + (raw-softMax)*easing : raw
 * 12. final         = clamp(softened, minProbability, maxProbability)
 *
 * Pure and stateless after construction; safe to share across threads.
 *
 * @ticket 0003_probability_resolver
 */
class ProbabilityResolver
{
public:
  /**
   * @brief Game-balance constants
   *
   * Defaults are the tuned lobbying values. Use lobbying() or research() for
   * the presets including their tier tables.
   */
  struct Config
  {
    std::map<std::string, double, std::less<>> tierBase;

    double spendScale{10000.0};
    double spendWeight{0.25};
    double influenceScale{100.0};
    double influenceWeight{0.20};
    double proximityWeight{0.50};
    double proximityHalfLife{4.0};  // Same unit as timeToEvent
    double compositeFactor{0.15};

    ReputationModel reputationModel{ReputationModel::Logistic};
    double reputationWeight{0.10};
    double reputationSteepness{0.10};
    double reputationMidpoint{50.0};

    double priorSuccessBase{0.02};
    double priorSuccessDecay{0.5};
    double priorSuccessCap{0.05};

    double economicMin{-0.05};  // Modifier at signal -1
    double economicMax{0.03};   // Modifier at signal +1

    double jitterRange{0.02};
    double jitterSpendThreshold{1000.0};

    double softMax{0.85};
    double easingFactor{0.30};
    double minProbability{0.01};
    double maxProbability{0.95};

    /// @brief Office-level tiers LOCAL, STATE, FEDERAL
    static Config lobbying();

    /// @brief Research tiers BASIC, APPLIED, FRONTIER
    static Config research();

    /**
     * @brief Check every constant is usable
     * @throws ValidationError on an empty tier table, non-positive scales or
     * half-life, an inverted probability range, or out-of-range factors
     */
    void validate() const;
  };

  /**
   * @brief Caller-facing inputs; optional fields default to neutral values
   */
  struct Inputs
  {
    std::string tier;                 // Difficulty tier key (e.g. "LOCAL")
    double spend{0.0};                // Money spent [currency], >= 0
    double influence{0.0};            // Influence score, >= 0
    double reputation{0.0};           // Nominal 0..100, clamped
    double compositeWeight{0.0};      // Nominal 0..1, clamped
    double timeToEvent{0.0};          // e.g. weeks until election, >= 0
    std::optional<std::string> seed;  // Jitter seed
    std::optional<uint32_t> priorSuccessCount;
    std::optional<double> economicCondition;  // Nominal -1..1, clamped
  };

  /**
   * @brief Inputs after boundary validation; every field populated and in
   * range
   */
  struct NormalizedInputs
  {
    double base{0.0};
    double spend{0.0};
    double influence{0.0};
    double reputation{0.0};
    double compositeWeight{0.0};
    double timeToEvent{0.0};
    std::string seed;
    bool hasSeed{false};
    uint32_t priorSuccessCount{0};
    double economicCondition{0.0};
  };

  /// @brief Discovery-tier cut points on roll quality (0..1]
  struct DiscoveryThresholds
  {
    double significant{0.5};
    double breakthrough{0.85};
  };

  /**
   * @brief Construct a resolver with validated constants
   * @throws ValidationError if config is unusable
   */
  explicit ProbabilityResolver(Config config);

  /**
   * @brief Validate and normalize caller inputs
   * @throws ValidationError for unknown tiers, non-finite values, or negative
   * spend/influence/timeToEvent
   */
  [[nodiscard]] NormalizedInputs normalize(const Inputs& inputs) const;

  /**
   * @brief Resolve a probability and its breakdown
   *
   * finalProbability is always within [minProbability, maxProbability];
   * a formula that degenerates to NaN resolves to minProbability.
   *
   * @throws ValidationError (see normalize)
   */
  [[nodiscard]] ProbabilityBreakdown resolve(const Inputs& inputs) const;

  /// @brief Capped geometric prior-success bonus
  [[nodiscard]] double priorSuccessBonus(uint32_t priorSuccessCount) const;

  [[nodiscard]] double reputationTerm(double reputation) const;

  [[nodiscard]] double economicModifier(double economicCondition) const;

  [[nodiscard]] double softEase(double raw) const;

  const Config& getConfig() const
  {
    return config_;
  }

  /**
   * @brief Deterministic success roll
   * @return true when unitInterval(seed) < probability
   */
  static bool roll(double probability, std::string_view seed);

  /**
   * @brief Deterministic discovery tier for a resolved probability
   *
   * A roll u = unitInterval(seed) at or above the probability is None.
   * Otherwise quality = 1 - u/probability grades the success.
   */
  static DiscoveryTier classifyDiscovery(double probability,
                                         std::string_view seed,
                                         const DiscoveryThresholds& thresholds);

private:
  [[nodiscard]] ProbabilityBreakdown resolve(
    const NormalizedInputs& inputs) const;

  Config config_;
};

std::string_view toString(DiscoveryTier tier);

}  // namespace civic_sim

#endif  // CIVIC_SIM_PROBABILITY_PROBABILITY_RESOLVER_HPP
