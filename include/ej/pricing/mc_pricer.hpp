#pragma once
/**
 * @file mc_pricer.hpp
 * @brief Pricer Monte Carlo d’un européen sous GBM (tirage exact de S_T).
 *
 * - M tirages N(0,1) d’un flux neuf de graine `seed`.
 * - S_T = S0 * exp((r - q - 0.5*sigma^2)T + sigma*sqrt(T)*Z).
 * - Valeur = exp(-rT) * moyenne des payoffs.
 */

#include <ej/config/mc_config.hpp>
#include <ej/pricing/pricer.hpp>

namespace ej {
namespace pricing {

class McPricer final : public Pricer {
public:
  explicit McPricer(config::MonteCarloParameters cfg) noexcept : cfg_(cfg) {}

  market::ModelTag model() const noexcept override { return market::ModelTag::MonteCarlo; }

  MonteCarloResult price_european(const market::OptionContract& contract) const override;

  const config::MonteCarloParameters& parameters() const noexcept { return cfg_; }

private:
  config::MonteCarloParameters cfg_;
};

} // namespace pricing
} // namespace ej
