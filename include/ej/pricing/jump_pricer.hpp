#pragma once
/**
 * @file jump_pricer.hpp
 * @brief Pricer Monte Carlo d’un européen sous le modèle à sauts de Merton.
 *
 * Simule la matrice (N+1) x M de `models::MertonJumpDiffusion`, puis évalue
 * le payoff sur la dernière ligne (S_T).
 */

#include <ej/config/mc_config.hpp>
#include <ej/pricing/pricer.hpp>

namespace ej {
namespace pricing {

class JumpDiffusionPricer final : public Pricer {
public:
  explicit JumpDiffusionPricer(config::JumpDiffusionParameters cfg) noexcept : cfg_(cfg) {}

  market::ModelTag model() const noexcept override { return market::ModelTag::JumpDiffusion; }

  MonteCarloResult price_european(const market::OptionContract& contract) const override;

  const config::JumpDiffusionParameters& parameters() const noexcept { return cfg_; }

private:
  config::JumpDiffusionParameters cfg_;
};

} // namespace pricing
} // namespace ej
