#include <ej/pricing/european_option.hpp>
#include <ej/core/errors.hpp>
#include <ej/pricing/jump_pricer.hpp>
#include <ej/pricing/mc_pricer.hpp>

#include <memory>    // std::make_shared
#include <utility>   // std::move

namespace ej {
namespace pricing {

EuropeanOption::EuropeanOption(market::OptionContract contract,
                               std::shared_ptr<const Pricer> pricer)
    : contract_(std::move(contract)), pricer_(std::move(pricer)) {
  if (!pricer_) {
    throw core::UnknownModel("EuropeanOption: no pricer for model " +
                             market::to_string(contract_.model));
  }
  if (pricer_->model() != contract_.model) {
    throw core::UnknownModel("EuropeanOption: contract model " +
                             market::to_string(contract_.model) +
                             " does not match pricer model " +
                             market::to_string(pricer_->model()));
  }
}

EuropeanOption EuropeanOption::monte_carlo(const market::OptionContract& contract,
                                           const config::MonteCarloParameters& params) {
  return EuropeanOption(contract, std::make_shared<McPricer>(params));
}

EuropeanOption EuropeanOption::jump_diffusion(const market::OptionContract& contract,
                                              const config::JumpDiffusionParameters& params) {
  return EuropeanOption(contract, std::make_shared<JumpDiffusionPricer>(params));
}

double EuropeanOption::value() const {
  return pricer_->price(contract_);
}

MonteCarloResult EuropeanOption::run() const {
  return pricer_->price_european(contract_);
}

} // namespace pricing
} // namespace ej
