#pragma once
/**
 * @file merton_jump.hpp
 * @brief Modèle à sauts de Merton (1976) sous Q, discrétisation par pas uniformes.
 *
 * # Dynamique
 *    dS_t / S_t- = (r - rj) dt + sigma dW_t + (J - 1) dN_t
 * avec N processus de Poisson d’intensité lambda, log J ~ N(mu_J, delta^2) et
 * le compensateur
 *    rj = lambda * ( exp(mu_J + 0.5*delta^2) - 1 )
 * qui retire l’excès de rendement espéré des sauts : le prix actualisé reste
 * une martingale sous Q.
 *
 * # Schéma (dt = T / N)
 *    S_t = S_{t-1} * ( exp( (r - rj - 0.5*sigma^2) dt + sigma*sqrt(dt)*Z1 )
 *                      + ( exp(mu_J + delta*Z2) - 1 ) * K_t )
 * avec Z1, Z2 ~ N(0,1) et K_t ~ Poisson(lambda*dt).
 * K_t pondère linéairement UN rendement de saut (pas de composition de K_t
 * sauts indépendants) : c’est la convention des prix de référence.
 *
 * # Ordre des tirages
 * Les aléas sont tirés par blocs complets de forme (N+1) x M, dans l’ordre :
 * tous les Z1, puis tous les Z2, puis tous les K. La ligne t de chaque bloc
 * sert au pas t ; la ligne 0 est tirée mais inutilisée.
 */

#include <cstddef>   // std::size_t
#include <cstdint>   // std::uint32_t

#include <ej/config/mc_config.hpp>
#include <ej/core/price_matrix.hpp>
#include <ej/core/random_stream.hpp>
#include <ej/market/option_contract.hpp>

namespace ej {
namespace models {

/// @brief Paramètres du modèle de Merton.
struct MertonParams {
  double r;         ///< Taux sans risque.
  double sigma;     ///< Volatilité de la diffusion (>= 0).
  double lambda;    ///< Intensité des sauts (>= 0).
  double jump_mean; ///< Moyenne du log-saut.
  double jump_vol;  ///< Écart-type du log-saut (> 0).
};

class MertonJumpDiffusion {
public:
  explicit MertonJumpDiffusion(MertonParams p);

  static MertonJumpDiffusion from_contract(const market::OptionContract& contract,
                                           const config::JumpDiffusionParameters& jp);

  const MertonParams& params() const noexcept { return params_; }

  /// @return rj = lambda * (exp(mu_J + 0.5*delta^2) - 1).
  double jump_compensator() const noexcept;

  /**
   * @brief Simule M trajectoires sur N pas.
   * @return Matrice (N+1) x M, ligne 0 = S0, ligne N = S_T.
   * @throws core::InvalidSimulationCount si n_steps == 0 ou n_paths == 0.
   */
  core::PriceMatrix simulate(double S0, double T,
                             std::size_t n_steps, std::size_t n_paths,
                             core::RandomStream& rng) const;

private:
  MertonParams params_;
};

/// @brief Trajectoires Merton pour un contrat, flux neuf de graine `seed`.
core::PriceMatrix simulate_paths(const market::OptionContract& contract,
                                 const config::JumpDiffusionParameters& jp,
                                 std::uint32_t seed);

/// @brief Idem avec la graine portée par `jp`.
core::PriceMatrix simulate_paths(const market::OptionContract& contract,
                                 const config::JumpDiffusionParameters& jp);

} // namespace models
} // namespace ej
