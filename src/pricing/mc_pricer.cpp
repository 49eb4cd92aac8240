#include <ej/pricing/mc_pricer.hpp>
#include <ej/models/gbm.hpp>
#include <ej/core/errors.hpp>

#include <chrono>    // steady_clock, duration_cast

namespace ej {
namespace pricing {

MonteCarloResult McPricer::price_european(const market::OptionContract& contract) const {
  if (contract.model != model()) {
    throw core::UnknownModel("McPricer: cannot price a " + market::to_string(contract.model) +
                             " contract");
  }

  using clock = std::chrono::steady_clock;
  const auto t0 = clock::now();

  const auto ST = models::sample_terminal_prices(contract, cfg_);
  MonteCarloResult res = evaluate(contract, ST);

  res.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0).count();
  return res;
}

} // namespace pricing
} // namespace ej
