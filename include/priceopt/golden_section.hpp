#pragma once
#include <functional>
#include <stdexcept>
#include <string>

namespace priceopt {

// Raised when the objective returns NaN or +-inf during the search.
class NonFiniteEvaluation : public std::runtime_error {
public:
  NonFiniteEvaluation(double x, double value);

  double at() const { return x_; }
  double value() const { return value_; }

private:
  double x_;
  double value_;
};

class GoldenSection {
public:
  struct Result {
    double optimal_x;     // midpoint of the final bracket
    double optimal_value; // f(optimal_x)
    int iterations;
    bool converged; // bracket width reached the tolerance
  };

  static constexpr double PHI = 0.6180339887498949; // (sqrt(5) - 1) / 2
  static constexpr double DEFAULT_TOLERANCE = 1e-3;
  static constexpr int DEFAULT_MAX_ITERS = 100;

  // Maximize a unimodal f over [low, high]. One new evaluation per
  // iteration; ties between the interior points shrink from the left.
  // Throws std::invalid_argument for a reversed or non-finite bracket or a
  // non-positive tolerance, NonFiniteEvaluation if f misbehaves.
  static Result maximize(const std::function<double(double)> &f, double low,
                         double high, double tolerance = DEFAULT_TOLERANCE,
                         int max_iters = DEFAULT_MAX_ITERS);
};

} // namespace priceopt
