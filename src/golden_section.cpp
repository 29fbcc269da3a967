#include "priceopt/golden_section.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace priceopt {

NonFiniteEvaluation::NonFiniteEvaluation(double x, double value)
    : std::runtime_error(
          fmt::format("objective is not finite at x={}: {}", x, value)),
      x_(x), value_(value) {}

GoldenSection::Result
GoldenSection::maximize(const std::function<double(double)> &f, double low,
                        double high, double tolerance, int max_iters) {
  if (!std::isfinite(low) || !std::isfinite(high))
    throw std::invalid_argument("search bracket must be finite");
  if (low > high)
    throw std::invalid_argument(
        fmt::format("empty search bracket [{}, {}]", low, high));
  if (!(tolerance > 0.0) || !std::isfinite(tolerance))
    throw std::invalid_argument("tolerance must be positive");
  if (max_iters < 0)
    throw std::invalid_argument("max_iters must be non-negative");

  auto eval = [&f](double x) {
    double v = f(x);
    if (!std::isfinite(v))
      throw NonFiniteEvaluation(x, v);
    return v;
  };

  double a = low, b = high;
  double x1 = b - PHI * (b - a);
  double x2 = a + PHI * (b - a);
  double f1 = eval(x1);
  double f2 = eval(x2);

  Result result{};
  while (std::abs(b - a) > tolerance && result.iterations < max_iters) {
    result.iterations++;
    if (f1 > f2) {
      // Maximum in [a, x2]
      b = x2;
      x2 = x1;
      f2 = f1;
      x1 = b - PHI * (b - a);
      f1 = eval(x1);
    } else {
      // Maximum in [x1, b]
      a = x1;
      x1 = x2;
      f1 = f2;
      x2 = a + PHI * (b - a);
      f2 = eval(x2);
    }
  }

  result.converged = std::abs(b - a) <= tolerance;
  result.optimal_x = (a + b) / 2.0;
  result.optimal_value = eval(result.optimal_x);

  if (!result.converged) {
    spdlog::warn("[GSS] Stopped at iteration cap {} with width {:.3e}",
                 max_iters, b - a);
  } else {
    spdlog::debug("[GSS] Converged in {} iters, x={:.6f} f={:.6f}",
                  result.iterations, result.optimal_x, result.optimal_value);
  }
  return result;
}

} // namespace priceopt
