#pragma once
/**
 * @file european_option.hpp
 * @brief Option européenne prête à être valorisée : contrat + pricer du modèle.
 *
 * # Usage
 *   market::OptionContract c("call", 100, 100, 1, 0, 0, 0.2, "JumpDiffusion");
 *   auto opt = EuropeanOption::jump_diffusion(c, {1.0, -0.2, 0.2, 100});
 *   double v = opt.value();
 *
 * # Sémantique
 * - `value()` relance une simulation complète à chaque appel (pas de cache).
 *   La graine vient des paramètres du pricer : deux appels donnent le même nombre.
 * - L’étiquette du contrat doit désigner le modèle du pricer ; sinon la
 *   construction échoue (core::UnknownModel). Les étiquettes sans pricer
 *   Monte Carlo (BlackScholes, BinomialTree) ne sont donc pas valorisables ici.
 */

#include <memory>
#include <string>

#include <ej/config/mc_config.hpp>
#include <ej/market/option_contract.hpp>
#include <ej/pricing/payoff_evaluator.hpp>
#include <ej/pricing/pricer.hpp>

namespace ej {
namespace pricing {

class EuropeanOption {
public:
  /// @throws core::UnknownModel si pricer est nul ou ne traite pas contract.model.
  EuropeanOption(market::OptionContract contract, std::shared_ptr<const Pricer> pricer);

  /// @brief Option au modèle simple (étiquette MonteCarlo).
  static EuropeanOption monte_carlo(const market::OptionContract& contract,
                                    const config::MonteCarloParameters& params =
                                        config::MonteCarloParameters());

  /// @brief Option au modèle de Merton (étiquette JumpDiffusion).
  static EuropeanOption jump_diffusion(const market::OptionContract& contract,
                                       const config::JumpDiffusionParameters& params);

  const market::OptionContract& contract() const noexcept { return contract_; }
  market::ModelTag model_tag() const noexcept { return contract_.model; }

  /// @brief Valeur actualisée (nouvelle simulation à chaque appel).
  double value() const;

  /// @brief Résultat détaillé (prix, erreur standard, IC 95 %, durée).
  MonteCarloResult run() const;

  /// @return "This EuropeanOption is priced using {modelTag}".
  std::string describe() const { return contract_.describe(); }

private:
  market::OptionContract contract_;
  std::shared_ptr<const Pricer> pricer_;
};

} // namespace pricing
} // namespace ej
