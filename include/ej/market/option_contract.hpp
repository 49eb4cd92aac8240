#pragma once
/**
 * @file option_contract.hpp
 * @brief Contrat d’option européenne (termes économiques + étiquette de modèle).
 *
 * # Contenu
 * - Type d’option : Call ou Put.
 * - Spot S0, strike K, maturité T (années fractionnelles).
 * - Taux sans risque r, taux de dividende q, volatilité sigma (décimal).
 * - Étiquette du modèle de pricing visé.
 *
 * # Domaine valide
 * - S0, K, r, q, sigma >= 0 et finis
 * - T > 0
 *
 * Immuable après construction ; toute violation fait échouer la construction.
 */

#include <string>

namespace ej {
namespace market {

/// @brief Type d’option vanille (Call ou Put).
enum class OptionType {
  Call, ///< Droit d’acheter le sous-jacent.
  Put   ///< Droit de vendre le sous-jacent.
};

/// @brief Modèles reconnus par l’étiquette d’un contrat.
enum class ModelTag {
  BlackScholes,
  MonteCarlo,
  BinomialTree,
  JumpDiffusion
};

/// @brief "call" / "put".
std::string to_string(OptionType type);

/// @brief Nom exact de l’étiquette ("MonteCarlo", "JumpDiffusion", ...).
std::string to_string(ModelTag tag);

/// @throws core::InvalidOptionType si `name` n’est ni "call" ni "put".
OptionType parse_option_type(const std::string& name);

/// @throws core::UnknownModel si `name` n’est pas l’une des quatre étiquettes.
ModelTag parse_model_tag(const std::string& name);

/// @brief Contrat d’option européenne validé à la construction.
struct OptionContract {
public:
  const OptionType type; ///< Call ou Put.
  const double S0;       ///< Spot initial (>= 0).
  const double K;        ///< Strike (>= 0).
  const double T;        ///< Maturité en années (> 0).
  const double r;        ///< Taux sans risque (>= 0).
  const double q;        ///< Taux de dividende (>= 0).
  const double sigma;    ///< Volatilité (>= 0).
  const ModelTag model;  ///< Modèle de pricing visé.

  /// @throws core::InvalidParameter si un champ numérique sort de son domaine.
  OptionContract(OptionType type, double S0, double K, double T,
                 double r, double q, double sigma, ModelTag model);

  /**
   * @brief Variante à partir de chaînes ("call"/"put", nom d’étiquette).
   * @throws core::InvalidOptionType, core::UnknownModel, core::InvalidParameter
   */
  OptionContract(const std::string& type, double S0, double K, double T,
                 double r, double q, double sigma, const std::string& model);

  /// @return Étiquette du modèle.
  ModelTag model_tag() const noexcept { return model; }

  bool is_call() const noexcept { return type == OptionType::Call; }

  /// @return "This EuropeanOption is priced using {modelTag}".
  std::string describe() const;
};

} // namespace market
} // namespace ej
