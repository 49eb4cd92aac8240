#include <ej/models/merton_jump.hpp>
#include <ej/core/errors.hpp>

#include <cmath>     // std::exp, std::sqrt
#include <vector>

namespace ej {
namespace models {

MertonJumpDiffusion::MertonJumpDiffusion(MertonParams p) : params_(p) {
  if (p.sigma < 0.0) {
    throw core::InvalidParameter("MertonJumpDiffusion: sigma must be >= 0");
  }
  if (p.lambda < 0.0) {
    throw core::InvalidParameter("MertonJumpDiffusion: lambda must be >= 0");
  }
  if (p.jump_vol <= 0.0) {
    throw core::InvalidParameter("MertonJumpDiffusion: jump_vol must be > 0");
  }
}

MertonJumpDiffusion MertonJumpDiffusion::from_contract(const market::OptionContract& contract,
                                                       const config::JumpDiffusionParameters& jp) {
  return MertonJumpDiffusion(MertonParams{contract.r, contract.sigma,
                                          jp.lambda, jp.jump_mean, jp.jump_vol});
}

double MertonJumpDiffusion::jump_compensator() const noexcept {
  const auto& p = params_;
  return p.lambda * (std::exp(p.jump_mean + 0.5 * p.jump_vol * p.jump_vol) - 1.0);
}

core::PriceMatrix MertonJumpDiffusion::simulate(double S0, double T,
                                                std::size_t n_steps, std::size_t n_paths,
                                                core::RandomStream& rng) const {
  if (n_steps == 0) {
    throw core::InvalidSimulationCount("MertonJumpDiffusion: n_steps must be > 0");
  }
  if (n_paths == 0) {
    throw core::InvalidSimulationCount("MertonJumpDiffusion: n_paths must be > 0");
  }
  if (!config::JumpDiffusionParameters::fits_grid(n_steps, n_paths)) {
    throw core::InvalidSimulationCount(
        "MertonJumpDiffusion: (n_steps + 1) * n_paths overflows std::size_t");
  }

  const auto& p = params_;
  const std::size_t rows = n_steps + 1;
  const std::size_t size = rows * n_paths;

  const double dt      = T / static_cast<double>(n_steps);
  const double rj      = jump_compensator();
  const double mu_dt   = (p.r - rj - 0.5 * p.sigma * p.sigma) * dt;
  const double vol_dt  = p.sigma * std::sqrt(dt);

  // Blocs d’aléas (N+1) x M : diffusion, taille des sauts, nombre de sauts.
  std::vector<double> z_diff(size);
  std::vector<double> z_jump(size);
  std::vector<std::int64_t> n_jumps(size);
  rng.normal_block(z_diff.data(), size);
  rng.normal_block(z_jump.data(), size);
  rng.poisson_block(p.lambda * dt, n_jumps.data(), size);

  core::PriceMatrix S(rows, n_paths, S0);
  for (std::size_t t = 1; t < rows; ++t) {
    const double* prev = S.row(t - 1);
    double*       cur  = S.row(t);
    const std::size_t off = t * n_paths;
    for (std::size_t j = 0; j < n_paths; ++j) {
      const double diffusion = std::exp(mu_dt + vol_dt * z_diff[off + j]);
      const double jump = (std::exp(p.jump_mean + p.jump_vol * z_jump[off + j]) - 1.0) *
                          static_cast<double>(n_jumps[off + j]);
      cur[j] = prev[j] * (diffusion + jump);
    }
  }
  return S;
}

core::PriceMatrix simulate_paths(const market::OptionContract& contract,
                                 const config::JumpDiffusionParameters& jp,
                                 std::uint32_t seed) {
  core::RandomStream rng(seed);
  return MertonJumpDiffusion::from_contract(contract, jp)
      .simulate(contract.S0, contract.T, jp.n_steps, jp.n_paths, rng);
}

core::PriceMatrix simulate_paths(const market::OptionContract& contract,
                                 const config::JumpDiffusionParameters& jp) {
  return simulate_paths(contract, jp, jp.seed);
}

} // namespace models
} // namespace ej
