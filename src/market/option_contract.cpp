#include <ej/market/option_contract.hpp>
#include <ej/core/errors.hpp>

#include <cmath>   // std::isfinite

namespace ej {
namespace market {

namespace {

void require_non_negative(double v, const char* name) {
  if (!std::isfinite(v) || v < 0.0) {
    throw core::InvalidParameter(std::string("OptionContract: ") + name +
                                 " must be finite and >= 0");
  }
}

} // anonymous namespace

std::string to_string(OptionType type) {
  return type == OptionType::Call ? "call" : "put";
}

std::string to_string(ModelTag tag) {
  switch (tag) {
    case ModelTag::BlackScholes:  return "BlackScholes";
    case ModelTag::MonteCarlo:    return "MonteCarlo";
    case ModelTag::BinomialTree:  return "BinomialTree";
    case ModelTag::JumpDiffusion: return "JumpDiffusion";
  }
  throw core::UnknownModel("to_string: unknown ModelTag value");
}

OptionType parse_option_type(const std::string& name) {
  if (name == "call") return OptionType::Call;
  if (name == "put")  return OptionType::Put;
  throw core::InvalidOptionType("OptionContract: option type must be 'call' or 'put', got '" +
                                name + "'");
}

ModelTag parse_model_tag(const std::string& name) {
  if (name == "BlackScholes")  return ModelTag::BlackScholes;
  if (name == "MonteCarlo")    return ModelTag::MonteCarlo;
  if (name == "BinomialTree")  return ModelTag::BinomialTree;
  if (name == "JumpDiffusion") return ModelTag::JumpDiffusion;
  throw core::UnknownModel("OptionContract: unknown model '" + name + "'");
}

OptionContract::OptionContract(OptionType type, double S0, double K, double T,
                               double r, double q, double sigma, ModelTag model)
    : type(type), S0(S0), K(K), T(T), r(r), q(q), sigma(sigma), model(model) {
  require_non_negative(S0, "spot");
  require_non_negative(K, "strike");
  if (!std::isfinite(T) || T <= 0.0) {
    throw core::InvalidParameter("OptionContract: maturity must be finite and > 0");
  }
  require_non_negative(r, "risk-free rate");
  require_non_negative(q, "dividend yield");
  require_non_negative(sigma, "volatility");
}

OptionContract::OptionContract(const std::string& type, double S0, double K, double T,
                               double r, double q, double sigma, const std::string& model)
    : OptionContract(parse_option_type(type), S0, K, T, r, q, sigma, parse_model_tag(model)) {}

std::string OptionContract::describe() const {
  return "This EuropeanOption is priced using " + to_string(model);
}

} // namespace market
} // namespace ej
