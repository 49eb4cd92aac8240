#pragma once
/**
 * @file gbm.hpp
 * @brief Modèle Black–Scholes / GBM sous mesure risque-neutre Q.
 *
 * # Gbm
 * Sous la mesure risque-neutre Q :
 *    dS_t / S_t = (r - q) dt + sigma dW_t
 *
 * Formule exacte pour S_T :
 *    S_T = S0 * exp( (r - q - 0.5*sigma^2) * T + sigma * sqrt(T) * Z )
 * où Z ~ N(0,1). Un seul pas suffit : aucune trajectoire n’est stockée.
 *
 * # Tests recommandés
 * - Moments de S_T vs formules fermées :
 *     E[S_T] = S0 * exp((r - q)T)
 * - Même graine ⇒ même vecteur, bit à bit.
 */

#include <cstddef>   // std::size_t
#include <cstdint>   // std::uint32_t
#include <vector>

#include <ej/config/mc_config.hpp>
#include <ej/core/random_stream.hpp>
#include <ej/market/option_contract.hpp>

namespace ej {
namespace models {

/// @brief Paramètres du modèle GBM (Black–Scholes).
struct GbmParams {
  double r;     ///< Taux sans risque (décimal).
  double q;     ///< Taux de dividende (décimal).
  double sigma; ///< Volatilité (>= 0).
};

/// @brief Modèle Black–Scholes / GBM sous mesure Q.
class Gbm {
public:
  explicit Gbm(GbmParams p);

  /// @brief Modèle aux paramètres (r, q, sigma) du contrat.
  static Gbm from_contract(const market::OptionContract& contract);

  const GbmParams& params() const noexcept { return params_; }

  /// @brief Une réalisation de S_T (pas exact lognormal).
  double sample_ST(double S0, double T, core::RandomStream& rng) const;

  /**
   * @brief n réalisations indépendantes de S_T, dans l’ordre des tirages.
   * @throws core::InvalidSimulationCount si n_paths == 0.
   */
  std::vector<double> sample_terminal(double S0, double T, std::size_t n_paths,
                                      core::RandomStream& rng) const;

private:
  GbmParams params_;
};

/**
 * @brief Prix terminaux du modèle simple pour un contrat, flux neuf de graine `seed`.
 * @throws core::InvalidSimulationCount si path_count == 0.
 */
std::vector<double> sample_terminal_prices(const market::OptionContract& contract,
                                           std::size_t path_count,
                                           std::uint32_t seed);

/// @brief Idem avec nombre de trajectoires et graine portés par `mp`.
std::vector<double> sample_terminal_prices(const market::OptionContract& contract,
                                           const config::MonteCarloParameters& mp);

} // namespace models
} // namespace ej
