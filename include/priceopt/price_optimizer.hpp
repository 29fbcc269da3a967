#pragma once
#include "priceopt/common.hpp"
#include "priceopt/demand_estimator.hpp"

namespace priceopt {

class PriceOptimizer {
public:
  static constexpr double FALLBACK_COST = 10.0;
  static constexpr double COST_RATIO = 0.7;

  PriceOptimizer() = default;
  explicit PriceOptimizer(const Config &config);

  // Full pipeline: bracket -> demand curve -> golden-section search over
  // profit(p) = (p - cost) * demand(p). Failures keep their kind.
  Outcome<OptimizationResult>
  run(const std::vector<double> &prices, const std::vector<double> &ratings,
      std::optional<double> cost = std::nullopt,
      std::optional<double> max_theoretical_demand = std::nullopt) const;

  // [min, max] of the finite prices, [0, 1000] when there are none
  static PriceBracket priceRange(const std::vector<double> &prices);

  // 70% of the cheapest finite price, 10 when there is none
  static double defaultCost(const std::vector<double> &prices);

  // Q(p) = max(0, a_d - b_d * p)
  static double demandAt(double price, const DemandParameters &params);

  // K(p) = (p - C) * Q(p)
  static double profitAt(double price, double cost,
                         const DemandParameters &params);

private:
  double tolerance_ = 1e-3;
  int max_iters_ = 100;
  DemandEstimator estimator_;
};

} // namespace priceopt
