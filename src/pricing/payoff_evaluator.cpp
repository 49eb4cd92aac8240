#include <ej/pricing/payoff_evaluator.hpp>
#include <ej/core/errors.hpp>
#include <ej/payoffs/vanilla.hpp>

#include <cmath>    // std::exp, std::sqrt

namespace ej {
namespace pricing {

namespace {

constexpr double Z95 = 1.959963984540054;

std::size_t checked_count(const double* first, const double* last) {
  if (first == nullptr || last <= first) {
    throw core::InvalidSimulationCount("PayoffEvaluator: no simulated prices to evaluate");
  }
  return static_cast<std::size_t>(last - first);
}

} // anonymous namespace

double price(const market::OptionContract& contract, const double* first, const double* last) {
  const std::size_t n = checked_count(first, last);
  double sum = 0.0;
  for (const double* it = first; it != last; ++it) {
    sum += payoffs::payoff(contract.type, *it, contract.K);
  }
  return std::exp(-contract.r * contract.T) * (sum / static_cast<double>(n));
}

double price(const market::OptionContract& contract, const std::vector<double>& terminal) {
  return price(contract, terminal.data(), terminal.data() + terminal.size());
}

MonteCarloResult evaluate(const market::OptionContract& contract,
                          const double* first, const double* last) {
  const std::size_t n = checked_count(first, last);
  const double df = std::exp(-contract.r * contract.T);
  const double value = price(contract, first, last);

  double se = 0.0;
  if (n > 1) {
    double ss = 0.0;
    for (const double* it = first; it != last; ++it) {
      const double d = df * payoffs::payoff(contract.type, *it, contract.K) - value;
      ss += d * d;
    }
    const double var = ss / static_cast<double>(n - 1);
    se = std::sqrt(var / static_cast<double>(n));
  }

  MonteCarloResult res{};
  res.price      = value;
  res.std_error  = se;
  res.ci_low     = value - Z95 * se;
  res.ci_high    = value + Z95 * se;
  res.n_paths    = n;
  res.elapsed_ms = 0;
  return res;
}

MonteCarloResult evaluate(const market::OptionContract& contract,
                          const std::vector<double>& terminal) {
  return evaluate(contract, terminal.data(), terminal.data() + terminal.size());
}

} // namespace pricing
} // namespace ej
