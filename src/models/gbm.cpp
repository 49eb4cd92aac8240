#include <ej/models/gbm.hpp>
#include <ej/core/errors.hpp>

#include <cmath>       // std::exp, std::sqrt

namespace ej {
namespace models {

Gbm::Gbm(GbmParams p) : params_(p) {
  if (p.sigma < 0.0) {
    throw core::InvalidParameter("Gbm: sigma must be >= 0");
  }
}

Gbm Gbm::from_contract(const market::OptionContract& contract) {
  return Gbm(GbmParams{contract.r, contract.q, contract.sigma});
}

double Gbm::sample_ST(double S0, double T, core::RandomStream& rng) const {
  const double mu  = (params_.r - params_.q - 0.5 * params_.sigma * params_.sigma) * T;
  const double vol = params_.sigma * std::sqrt(T);
  return S0 * std::exp(mu + vol * rng.normal());
}

std::vector<double> Gbm::sample_terminal(double S0, double T, std::size_t n_paths,
                                         core::RandomStream& rng) const {
  if (n_paths == 0) {
    throw core::InvalidSimulationCount("Gbm: n_paths must be > 0");
  }
  // Tous les Z d’abord, puis la transformation (même ordre de consommation).
  std::vector<double> out(n_paths);
  rng.normal_block(out.data(), n_paths);

  const double mu  = (params_.r - params_.q - 0.5 * params_.sigma * params_.sigma) * T;
  const double vol = params_.sigma * std::sqrt(T);
  for (double& x : out) {
    x = S0 * std::exp(mu + vol * x);
  }
  return out;
}

std::vector<double> sample_terminal_prices(const market::OptionContract& contract,
                                           std::size_t path_count,
                                           std::uint32_t seed) {
  core::RandomStream rng(seed);
  return Gbm::from_contract(contract).sample_terminal(contract.S0, contract.T, path_count, rng);
}

std::vector<double> sample_terminal_prices(const market::OptionContract& contract,
                                           const config::MonteCarloParameters& mp) {
  return sample_terminal_prices(contract, mp.n_paths, mp.seed);
}

} // namespace models
} // namespace ej
