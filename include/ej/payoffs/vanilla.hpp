#pragma once
/**
 * @file vanilla.hpp
 * @brief Payoffs d’options vanille européennes.
 *
 * - Call européen : max(S_T - K, 0).
 * - Put européen  : max(K - S_T, 0).
 */

#include <algorithm> // std::max

#include <ej/market/option_contract.hpp>

namespace ej {
namespace payoffs {

inline double payoff_call(double ST, double K) noexcept {
  return std::max(ST - K, 0.0);
}

inline double payoff_put(double ST, double K) noexcept {
  return std::max(K - ST, 0.0);
}

/// @brief Payoff selon le type d’option.
inline double payoff(market::OptionType type, double ST, double K) noexcept {
  return type == market::OptionType::Call ? payoff_call(ST, K) : payoff_put(ST, K);
}

} // namespace payoffs
} // namespace ej
