#pragma once
/**
 * @file payoff_evaluator.hpp
 * @brief Réduction des prix terminaux simulés en valeur actualisée.
 *
 * # Principe
 * - Payoff par trajectoire selon le type du contrat (call/put).
 * - Valeur = exp(-r*T) * moyenne des payoffs.
 * - Pas d’aléa, pas d’état : réduction pure.
 *
 * # Erreur standard
 * - Variance d’échantillon (diviseur n-1) des payoffs actualisés, en deux passes.
 * - std_error = sqrt(variance / n) ; vaut 0 si n == 1.
 * - IC 95 % : price ± 1.959963984540054 * std_error.
 */

#include <cstddef>
#include <vector>

#include <ej/market/option_contract.hpp>

namespace ej {
namespace pricing {

/// @brief Résultat d’un run Monte Carlo.
struct MonteCarloResult {
  double price;          ///< Valeur actualisée estimée.
  double std_error;      ///< Erreur standard de l’estimateur.
  double ci_low;         ///< Borne basse de l’IC 95 %.
  double ci_high;        ///< Borne haute de l’IC 95 %.
  std::size_t n_paths;   ///< Nombre de trajectoires évaluées.
  long long elapsed_ms;  ///< Durée simulation + évaluation (renseignée par les pricers).
};

/**
 * @brief exp(-rT) * moyenne des payoffs.
 * @throws core::InvalidSimulationCount si `terminal` est vide.
 */
double price(const market::OptionContract& contract, const std::vector<double>& terminal);

/// @brief Variante sur un intervalle [first, last).
double price(const market::OptionContract& contract, const double* first, const double* last);

/**
 * @brief Prix, erreur standard et IC 95 % (elapsed_ms laissé à 0).
 * @throws core::InvalidSimulationCount si l’intervalle est vide.
 */
MonteCarloResult evaluate(const market::OptionContract& contract,
                          const double* first, const double* last);

MonteCarloResult evaluate(const market::OptionContract& contract,
                          const std::vector<double>& terminal);

} // namespace pricing
} // namespace ej
