#include "priceopt/demand_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace priceopt {

double DemandEstimator::defaultMaxDemand(size_t sample_count) {
  return std::max(MIN_DEFAULT_DEMAND,
                  std::floor(static_cast<double>(sample_count) * 0.1));
}

DemandEstimator::LinearFit
DemandEstimator::fitLeastSquares(const Eigen::VectorXd &x,
                                 const Eigen::VectorXd &y,
                                 bool with_intercept) {
  const Eigen::Index n = x.size();
  if (n == 0 || y.size() != n)
    throw std::runtime_error("design matrix and target differ in size");

  LinearFit fit{0.0, 0.0, with_intercept};
  double x_mean = 0.0, y_mean = 0.0;
  if (with_intercept) {
    x_mean = x.mean();
    y_mean = y.mean();
  }

  Eigen::MatrixXd X(n, 1);
  X.col(0) = (x.array() - x_mean).matrix();
  Eigen::VectorXd rhs = (y.array() - y_mean).matrix();

  // Complete orthogonal decomposition gives the minimum-norm solution when
  // X is rank deficient (every price identical).
  Eigen::VectorXd coef = X.completeOrthogonalDecomposition().solve(rhs);

  fit.slope = coef[0];
  fit.intercept = with_intercept ? y_mean - fit.slope * x_mean : 0.0;

  if (!std::isfinite(fit.slope) || !std::isfinite(fit.intercept))
    throw std::runtime_error("least-squares solution is not finite");
  return fit;
}

double DemandEstimator::rSquared(const Eigen::VectorXd &y,
                                 const Eigen::VectorXd &y_pred) {
  double ss_res = (y - y_pred).squaredNorm();
  double ss_tot = (y.array() - y.mean()).matrix().squaredNorm();
  if (ss_tot == 0.0)
    return ss_res == 0.0 ? 1.0 : 0.0;
  return 1.0 - ss_res / ss_tot;
}

Outcome<DemandParameters>
DemandEstimator::estimate(const std::vector<double> &prices,
                          const std::vector<double> &ratings,
                          std::optional<double> max_theoretical_demand) const {
  using Result = Outcome<DemandParameters>;
  spdlog::info("[Demand] Estimating demand parameters...");

  if (prices.empty() || ratings.empty()) {
    spdlog::error("[Demand] Empty prices or ratings data");
    return Result::fail(FailureKind::EMPTY_INPUT,
                        "empty prices or ratings data");
  }
  if (prices.size() != ratings.size()) {
    spdlog::error("[Demand] Prices ({}) and ratings ({}) differ in length",
                  prices.size(), ratings.size());
    return Result::fail(FailureKind::LENGTH_MISMATCH,
                        "prices and ratings lists have different lengths");
  }

  // ── Scale ratings, drop rows with missing values ──
  std::vector<double> px, rt;
  px.reserve(prices.size());
  rt.reserve(ratings.size());
  for (size_t i = 0; i < prices.size(); i++) {
    double scaled = ratings[i] * RATING_SCALE;
    if (!std::isfinite(prices[i]) || !std::isfinite(scaled))
      continue;
    px.push_back(prices[i]);
    rt.push_back(scaled);
  }

  if (px.empty()) {
    spdlog::error("[Demand] No valid data for demand estimation");
    return Result::fail(FailureKind::NO_VALID_DATA,
                        "no valid data for demand estimation");
  }
  if (px.size() < prices.size())
    spdlog::debug("[Demand] Dropped {} rows with missing values",
                  prices.size() - px.size());

  // ── Normalize to demand proportion, target = 1 - proportion ──
  double max_rating = *std::max_element(rt.begin(), rt.end());
  if (!(max_rating > 0.0)) {
    spdlog::error("[Demand] Maximum rating is {}, cannot normalize demand",
                  max_rating);
    return Result::fail(FailureKind::REGRESSION_FAILURE,
                        "maximum rating is zero, demand proportion undefined");
  }

  const Eigen::Index n = static_cast<Eigen::Index>(px.size());
  Eigen::VectorXd x(n), y(n);
  for (Eigen::Index i = 0; i < n; i++) {
    x[i] = px[i];
    y[i] = 1.0 - rt[i] / max_rating;
  }

  DemandParameters params;
  params.sample_count = px.size();

  try {
    LinearFit fit = fitLeastSquares(x, y, true);
    if (std::abs(fit.intercept) < INTERCEPT_THRESHOLD) {
      spdlog::info("[Demand] Intercept close to zero, using model without "
                   "intercept");
      fit = fitLeastSquares(x, y, false);
    } else {
      spdlog::info("[Demand] Using model with intercept: {:.6f}",
                   fit.intercept);
    }

    double demand_scale;
    if (max_theoretical_demand && std::isfinite(*max_theoretical_demand) &&
        *max_theoretical_demand > 0.0) {
      demand_scale = *max_theoretical_demand;
    } else {
      if (max_theoretical_demand)
        spdlog::warn("[Demand] Ignoring non-positive max theoretical demand "
                     "{}",
                     *max_theoretical_demand);
      demand_scale = defaultMaxDemand(prices.size());
      spdlog::info("[Demand] Using default max theoretical demand: {}",
                   demand_scale);
    }

    params.a_d = demand_scale;
    params.slope = fit.slope;
    params.intercept = fit.intercept;
    params.used_intercept = fit.with_intercept;
    if (fit.slope < 0.0) {
      spdlog::warn("[Demand] Negative price sensitivity detected, using "
                   "absolute value");
      params.sign_corrected = true;
    }
    params.b_d = std::abs(fit.slope) * demand_scale;

    Eigen::VectorXd y_pred =
        ((x * fit.slope).array() + fit.intercept).matrix();
    params.r2 = rSquared(y, y_pred);
  } catch (const std::exception &e) {
    spdlog::error("[Demand] Error in demand estimation: {}", e.what());
    return Result::fail(FailureKind::REGRESSION_FAILURE, e.what());
  }

  spdlog::info("[Demand] a_d={:.2f} b_d={:.6f} R²={:.4f} (n={})", params.a_d,
               params.b_d, params.r2, params.sample_count);
  return Result::success(params);
}

} // namespace priceopt
