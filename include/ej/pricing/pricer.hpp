#pragma once
/**
 * @file pricer.hpp
 * @brief Interface commune des pricers Monte Carlo (une variante par modèle).
 *
 * Un pricer est immuable et sans état entre appels : chaque appel construit
 * son propre flux aléatoire à partir de la graine de ses paramètres. Deux
 * appels identiques donnent donc le même nombre, et plusieurs threads peuvent
 * partager la même instance.
 */

#include <ej/market/option_contract.hpp>
#include <ej/pricing/payoff_evaluator.hpp>

namespace ej {
namespace pricing {

class Pricer {
public:
  virtual ~Pricer() = default;

  /// @brief Modèle implémenté (doit correspondre à l’étiquette du contrat).
  virtual market::ModelTag model() const noexcept = 0;

  /// @brief Simulation complète + résultat détaillé.
  virtual MonteCarloResult price_european(const market::OptionContract& contract) const = 0;

  /// @brief Valeur actualisée seule.
  double price(const market::OptionContract& contract) const {
    return price_european(contract).price;
  }
};

} // namespace pricing
} // namespace ej
