#pragma once
/**
 * @file mc_config.hpp
 * @brief Paramètres de simulation des deux modèles (GBM simple, Merton).
 *
 * # MonteCarloParameters (modèle simple)
 * - n_paths : nombre de trajectoires (> 0, défaut 100 000).
 * - seed    : graine du flux aléatoire (défaut 1234567890).
 *
 * # JumpDiffusionParameters (Merton 1976)
 * - lambda    : intensité de Poisson des sauts (>= 0, par an).
 * - jump_mean : moyenne du log-saut (signe libre).
 * - jump_vol  : écart-type du log-saut (> 0).
 * - n_steps   : nombre de pas du calendrier uniforme (> 0).
 * - n_paths   : nombre de trajectoires (> 0, défaut 10 000).
 * - seed      : graine du flux aléatoire (défaut 1234567890).
 *
 * Validés une fois à la construction, immuables ensuite.
 */

#include <cmath>     // std::isfinite
#include <cstddef>   // std::size_t
#include <cstdint>   // std::uint32_t
#include <limits>    // std::numeric_limits
#include <stdexcept> // std::out_of_range
#include <string>

#include <ej/core/errors.hpp>
#include <ej/core/random_stream.hpp>

namespace ej {
namespace config {

/// @brief Paramètres du pricer Monte Carlo simple (tirage direct de S_T).
struct MonteCarloParameters {
  const std::size_t   n_paths; ///< Nombre de trajectoires (> 0).
  const std::uint32_t seed;    ///< Graine du flux.

  /// @throws core::InvalidSimulationCount si n_paths == 0.
  explicit MonteCarloParameters(std::size_t n_paths = 100'000,
                                std::uint32_t seed = core::RandomStream::kDefaultSeed)
      : n_paths(n_paths), seed(seed) {
    if (n_paths == 0) {
      throw core::InvalidSimulationCount("MonteCarloParameters: n_paths must be > 0");
    }
  }
};

/// @brief Paramètres du modèle à sauts de Merton et de sa discrétisation.
struct JumpDiffusionParameters {
  const double        lambda;    ///< Intensité des sauts (>= 0).
  const double        jump_mean; ///< Moyenne du log-saut.
  const double        jump_vol;  ///< Volatilité du log-saut (> 0).
  const std::size_t   n_steps;   ///< Pas de temps (> 0).
  const std::size_t   n_paths;   ///< Trajectoires (> 0).
  const std::uint32_t seed;      ///< Graine du flux.

  /**
   * @throws core::InvalidParameter       si lambda < 0, jump_vol <= 0 ou valeur non finie.
   * @throws core::InvalidSimulationCount si n_steps == 0, n_paths == 0 ou si
   *         (n_steps+1) * n_paths ne tient pas dans un std::size_t.
   */
  JumpDiffusionParameters(double lambda,
                          double jump_mean,
                          double jump_vol,
                          std::size_t n_steps,
                          std::size_t n_paths = 10'000,
                          std::uint32_t seed = core::RandomStream::kDefaultSeed)
      : lambda(lambda),
        jump_mean(jump_mean),
        jump_vol(jump_vol),
        n_steps(n_steps),
        n_paths(n_paths),
        seed(seed) {
    if (!std::isfinite(lambda) || lambda < 0.0) {
      throw core::InvalidParameter("JumpDiffusionParameters: lambda must be finite and >= 0");
    }
    if (!std::isfinite(jump_mean)) {
      throw core::InvalidParameter("JumpDiffusionParameters: jump_mean must be finite");
    }
    if (!std::isfinite(jump_vol) || jump_vol <= 0.0) {
      throw core::InvalidParameter("JumpDiffusionParameters: jump_vol must be finite and > 0");
    }
    if (n_steps == 0) {
      throw core::InvalidSimulationCount("JumpDiffusionParameters: n_steps must be > 0");
    }
    if (n_paths == 0) {
      throw core::InvalidSimulationCount("JumpDiffusionParameters: n_paths must be > 0");
    }
    if (!fits_grid(n_steps, n_paths)) {
      throw core::InvalidSimulationCount(
          "JumpDiffusionParameters: (n_steps + 1) * n_paths overflows std::size_t");
    }
  }

  /// @brief true si une grille (n_steps+1) x n_paths est adressable.
  static bool fits_grid(std::size_t n_steps, std::size_t n_paths) noexcept {
    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    return n_steps < max && n_paths <= max / (n_steps + 1);
  }
};

/**
 * @brief Lit une graine décimale (runners CLI).
 * @throws std::invalid_argument si `text` n’est pas un entier.
 * @throws std::out_of_range si la valeur dépasse 2^32 - 1 (pas de troncature).
 */
inline std::uint32_t parse_seed(const std::string& text) {
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    throw std::invalid_argument("parse_seed: expected an unsigned integer, got '" + text + "'");
  }
  std::size_t used = 0;
  const unsigned long long v = std::stoull(text, &used);
  if (used != text.size()) {
    throw std::invalid_argument("parse_seed: trailing characters in '" + text + "'");
  }
  if (v > std::numeric_limits<std::uint32_t>::max()) {
    throw std::out_of_range("parse_seed: seed must be <= 4294967295, got " + text);
  }
  return static_cast<std::uint32_t>(v);
}

} // namespace config
} // namespace ej
