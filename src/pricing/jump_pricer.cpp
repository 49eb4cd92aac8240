#include <ej/pricing/jump_pricer.hpp>
#include <ej/models/merton_jump.hpp>
#include <ej/core/errors.hpp>

#include <chrono>    // steady_clock, duration_cast

namespace ej {
namespace pricing {

MonteCarloResult JumpDiffusionPricer::price_european(const market::OptionContract& contract) const {
  if (contract.model != model()) {
    throw core::UnknownModel("JumpDiffusionPricer: cannot price a " + market::to_string(contract.model) +
                             " contract");
  }

  using clock = std::chrono::steady_clock;
  const auto t0 = clock::now();

  const core::PriceMatrix S = models::simulate_paths(contract, cfg_);

  // Dernière ligne = S_T, évaluée en place.
  const double* last_row = S.row(S.rows() - 1);
  MonteCarloResult res = evaluate(contract, last_row, last_row + S.cols());

  res.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0).count();
  return res;
}

} // namespace pricing
} // namespace ej
