#pragma once
#include "priceopt/common.hpp"
#include <Eigen/Dense>

namespace priceopt {

class DemandEstimator {
public:
  static constexpr double RATING_SCALE = 100.0;
  static constexpr double INTERCEPT_THRESHOLD = 0.05;
  static constexpr double MIN_DEFAULT_DEMAND = 100.0;

  struct LinearFit {
    double slope;
    double intercept;
    bool with_intercept;
  };

  DemandEstimator() = default;

  // Fit the linear demand model
  //   demand_proportion = 1 - (b_d / a_d) * price
  // where demand_proportion = rating / max(rating). a_d is not fitted: it is
  // the caller's max_theoretical_demand (or the sample-size default).
  Outcome<DemandParameters>
  estimate(const std::vector<double> &prices,
           const std::vector<double> &ratings,
           std::optional<double> max_theoretical_demand = std::nullopt) const;

  // max(100, floor(n / 10))
  static double defaultMaxDemand(size_t sample_count);

  // Ordinary least squares of y on x. With an intercept the data is centered
  // first, so a constant x yields the minimum-norm answer slope = 0.
  // Throws std::runtime_error if the solution is not finite.
  static LinearFit fitLeastSquares(const Eigen::VectorXd &x,
                                   const Eigen::VectorXd &y,
                                   bool with_intercept);

  // Coefficient of determination. A constant target scores 1 for an exact
  // fit and 0 otherwise.
  static double rSquared(const Eigen::VectorXd &y,
                         const Eigen::VectorXd &y_pred);
};

} // namespace priceopt
