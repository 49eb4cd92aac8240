#pragma once
/**
 * @file errors.hpp
 * @brief Exceptions levées par la lib lors de la validation des entrées.
 *
 * Toutes dérivent de `PricingError` (lui-même un `std::invalid_argument`) :
 * un appelant peut attraper la famille entière ou un cas précis.
 *
 * - InvalidOptionType      : type d’option hors {call, put}.
 * - UnknownModel           : étiquette de modèle inconnue ou sans pricer.
 * - InvalidParameter       : champ numérique négatif / non fini / nul interdit.
 * - InvalidSimulationCount : nombre de trajectoires ou de pas nul.
 *
 * La validation est faite à la construction : un objet construit ne doit
 * jamais échouer plus tard, pendant le pricing, pour une raison connaissable
 * à la construction.
 */

#include <stdexcept> // std::invalid_argument
#include <string>

namespace ej {
namespace core {

class PricingError : public std::invalid_argument {
public:
  explicit PricingError(const std::string& what) : std::invalid_argument(what) {}
};

class InvalidOptionType : public PricingError {
public:
  explicit InvalidOptionType(const std::string& what) : PricingError(what) {}
};

class UnknownModel : public PricingError {
public:
  explicit UnknownModel(const std::string& what) : PricingError(what) {}
};

class InvalidParameter : public PricingError {
public:
  explicit InvalidParameter(const std::string& what) : PricingError(what) {}
};

class InvalidSimulationCount : public PricingError {
public:
  explicit InvalidSimulationCount(const std::string& what) : PricingError(what) {}
};

} // namespace core
} // namespace ej
