#include "priceopt/price_optimizer.hpp"
#include "priceopt/golden_section.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace priceopt {

PriceOptimizer::PriceOptimizer(const Config &config)
    : tolerance_(config.gs_tolerance), max_iters_(config.gs_max_iters) {}

PriceBracket PriceOptimizer::priceRange(const std::vector<double> &prices) {
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  for (double p : prices) {
    if (!std::isfinite(p))
      continue;
    lo = std::min(lo, p);
    hi = std::max(hi, p);
  }
  if (lo > hi)
    return PriceBracket{0.0, 1000.0};
  return PriceBracket{lo, hi};
}

double PriceOptimizer::defaultCost(const std::vector<double> &prices) {
  double cheapest = std::numeric_limits<double>::infinity();
  for (double p : prices)
    if (std::isfinite(p))
      cheapest = std::min(cheapest, p);
  return std::isfinite(cheapest) ? cheapest * COST_RATIO : FALLBACK_COST;
}

double PriceOptimizer::demandAt(double price, const DemandParameters &params) {
  return std::max(0.0, params.a_d - params.b_d * price);
}

double PriceOptimizer::profitAt(double price, double cost,
                                const DemandParameters &params) {
  return (price - cost) * demandAt(price, params);
}

Outcome<OptimizationResult>
PriceOptimizer::run(const std::vector<double> &prices,
                    const std::vector<double> &ratings,
                    std::optional<double> cost,
                    std::optional<double> max_theoretical_demand) const {
  using Result = Outcome<OptimizationResult>;
  auto start = std::chrono::steady_clock::now();

  // ── Step 1: Price bracket ──
  PriceBracket range = priceRange(prices);
  spdlog::info("[Optimizer] Price range: {:.2f} - {:.2f}", range.low,
               range.high);

  // ── Step 2: Demand curve ──
  auto params = estimator_.estimate(prices, ratings, max_theoretical_demand);
  if (!params) {
    spdlog::error("[Optimizer] Failed to estimate demand parameters ({})",
                  failureKindName(params.failure));
    return Result::from(params);
  }

  // ── Step 3: Unit cost ──
  double unit_cost;
  if (cost) {
    if (!std::isfinite(*cost)) {
      spdlog::error("[Optimizer] Unit cost {} is not finite", *cost);
      return Result::fail(FailureKind::INVALID_ARGUMENT,
                          "unit cost must be finite");
    }
    unit_cost = *cost;
  } else {
    unit_cost = defaultCost(prices);
    spdlog::info("[Optimizer] Using default cost: {:.2f}", unit_cost);
  }

  // ── Step 4: Golden-section search over profit ──
  const DemandParameters &demand = *params;
  auto profit = [&](double price) {
    return profitAt(price, unit_cost, demand);
  };

  spdlog::info("[Optimizer] Running golden section search...");
  GoldenSection::Result search{};
  try {
    search = GoldenSection::maximize(profit, range.low, range.high, tolerance_,
                                     max_iters_);
  } catch (const NonFiniteEvaluation &e) {
    spdlog::error("[Optimizer] {}", e.what());
    return Result::fail(FailureKind::NON_FINITE_PROFIT, e.what());
  } catch (const std::invalid_argument &e) {
    spdlog::error("[Optimizer] {}", e.what());
    return Result::fail(FailureKind::INVALID_ARGUMENT, e.what());
  }

  // ── Step 5: Assemble ──
  OptimizationResult out;
  out.optimum_price = search.optimal_x;
  out.maximum_profit = search.optimal_value;
  out.estimated_demand = demandAt(search.optimal_x, demand);
  out.iterations = search.iterations;
  out.demand_parameters = demand;
  out.price_range = range;
  out.cost = unit_cost;

  spdlog::info("[Optimizer] Optimization complete after {} iterations "
               "({:.1f}ms)",
               out.iterations, elapsed_ms(start));
  spdlog::info("[Optimizer]   Optimum price:    {:.2f}", out.optimum_price);
  spdlog::info("[Optimizer]   Maximum profit:   {:.2f}", out.maximum_profit);
  spdlog::info("[Optimizer]   Estimated demand: {:.2f} units",
               out.estimated_demand);
  return Result::success(out);
}

} // namespace priceopt
