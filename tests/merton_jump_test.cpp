#include <gtest/gtest.h>

#include <ej/core/errors.hpp>
#include <ej/core/price_matrix.hpp>
#include <ej/core/random_stream.hpp>
#include <ej/models/merton_jump.hpp>

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

using ej::config::JumpDiffusionParameters;
using ej::market::OptionContract;

namespace {

OptionContract jd_call(double sigma = 0.2, double r = 0.0) {
  return OptionContract("call", 100.0, 100.0, 1.0, r, 0.0, sigma, "JumpDiffusion");
}

} // namespace

TEST(MertonJumpTest, CompensatorValue) {
  const ej::models::MertonJumpDiffusion m({0.0, 0.2, 1.0, -0.2, 0.2});
  EXPECT_NEAR(m.jump_compensator(), std::exp(-0.2 + 0.02) - 1.0, 1e-15);

  const ej::models::MertonJumpDiffusion none({0.0, 0.2, 0.0, -0.2, 0.2});
  EXPECT_EQ(none.jump_compensator(), 0.0);
}

TEST(MertonJumpTest, MatrixShapeAndInitialRow) {
  const JumpDiffusionParameters jp(1.0, -0.2, 0.2, 12, 300, 5u);
  const auto S = ej::models::simulate_paths(jd_call(), jp);
  ASSERT_EQ(S.rows(), 13u);
  ASSERT_EQ(S.cols(), 300u);
  for (std::size_t j = 0; j < S.cols(); ++j) {
    EXPECT_EQ(S.at(0, j), 100.0);
  }
  EXPECT_EQ(S.terminal_row().size(), 300u);
}

TEST(MertonJumpTest, DeterministicForFixedSeed) {
  const JumpDiffusionParameters jp(1.0, -0.2, 0.2, 50, 1000);
  const auto a = ej::models::simulate_paths(jd_call(), jp, 1234567890u);
  const auto b = ej::models::simulate_paths(jd_call(), jp, 1234567890u);
  EXPECT_EQ(a.data(), b.data());

  const auto c = ej::models::simulate_paths(jd_call(), jp, 42u);
  EXPECT_NE(a.data(), c.data());
}

// Sans sauts, la trajectoire est un GBM discret : S_N = S0 * exp(somme des incréments).
TEST(MertonJumpTest, NoJumpsReducesToGbm) {
  const std::size_t N = 20, M = 500;
  const double sigma = 0.3, r = 0.04, T = 1.0;
  const JumpDiffusionParameters jp(0.0, -0.2, 0.2, N, M, 77u);
  const auto S = ej::models::simulate_paths(jd_call(sigma, r), jp);

  // Même consommation : bloc diffusion (N+1) x M en premier, ligne 0 ignorée.
  ej::core::RandomStream rng(77u);
  std::vector<double> z((N + 1) * M);
  rng.normal_block(z.data(), z.size());

  const double dt = T / static_cast<double>(N);
  const double mu_dt  = (r - 0.5 * sigma * sigma) * dt;
  const double vol_dt = sigma * std::sqrt(dt);
  const auto ST = S.terminal_row();
  for (std::size_t j = 0; j < M; ++j) {
    double log_sum = 0.0;
    for (std::size_t t = 1; t <= N; ++t) {
      log_sum += mu_dt + vol_dt * z[t * M + j];
    }
    EXPECT_NEAR(ST[j] / (100.0 * std::exp(log_sum)), 1.0, 1e-12);
  }
}

TEST(MertonJumpTest, DiscountedMeanStaysNearSpot) {
  const JumpDiffusionParameters jp(1.0, -0.2, 0.2, 100, 10000);
  const auto ST = ej::models::simulate_paths(jd_call(0.2, 0.0), jp).terminal_row();
  double sum = 0.0;
  for (double s : ST) sum += s;
  // Erreur standard de la moyenne ~ 0.32 pour ces paramètres.
  EXPECT_NEAR(sum / static_cast<double>(ST.size()), 100.0, 1.5);
}

TEST(MertonJumpTest, ParameterValidation) {
  using ej::core::InvalidParameter;
  using ej::core::InvalidSimulationCount;
  EXPECT_THROW(JumpDiffusionParameters(-1.0, 0.0, 0.2, 10), InvalidParameter);
  EXPECT_THROW(JumpDiffusionParameters(1.0, 0.0, 0.0, 10), InvalidParameter);
  EXPECT_THROW(JumpDiffusionParameters(1.0, 0.0, -0.2, 10), InvalidParameter);
  EXPECT_THROW(JumpDiffusionParameters(1.0, 0.0, 0.2, 0), InvalidSimulationCount);
  EXPECT_THROW(JumpDiffusionParameters(1.0, 0.0, 0.2, 10, 0), InvalidSimulationCount);
}

TEST(MertonJumpTest, DefaultsPathsAndSeed) {
  const JumpDiffusionParameters jp(1.0, -0.2, 0.2, 100);
  EXPECT_EQ(jp.n_paths, 10000u);
  EXPECT_EQ(jp.seed, 1234567890u);
}

TEST(MertonJumpTest, SimulateRejectsZeroCounts) {
  const ej::models::MertonJumpDiffusion m({0.0, 0.2, 1.0, -0.2, 0.2});
  ej::core::RandomStream rng(1u);
  EXPECT_THROW(m.simulate(100.0, 1.0, 0, 10, rng), ej::core::InvalidSimulationCount);
  EXPECT_THROW(m.simulate(100.0, 1.0, 10, 0, rng), ej::core::InvalidSimulationCount);
}

TEST(MertonJumpTest, RejectsGridLargerThanAddressSpace) {
  const std::size_t max = std::numeric_limits<std::size_t>::max();
  // (n_steps + 1) * n_paths se replierait sur une petite valeur.
  const std::size_t n_steps = (std::size_t{1} << (sizeof(std::size_t) * 4 + 1)) - 1;
  const std::size_t n_paths = std::size_t{1} << (sizeof(std::size_t) * 4 - 1);
  EXPECT_THROW(JumpDiffusionParameters(1.0, -0.2, 0.2, n_steps, n_paths),
               ej::core::InvalidSimulationCount);
  EXPECT_THROW(JumpDiffusionParameters(1.0, -0.2, 0.2, max, 1), ej::core::InvalidSimulationCount);
  EXPECT_THROW(JumpDiffusionParameters(1.0, -0.2, 0.2, 1, max), ej::core::InvalidSimulationCount);
  EXPECT_NO_THROW(JumpDiffusionParameters(1.0, -0.2, 0.2, 1, max / 2));

  const ej::models::MertonJumpDiffusion m({0.0, 0.2, 1.0, -0.2, 0.2});
  ej::core::RandomStream rng(1u);
  EXPECT_THROW(m.simulate(100.0, 1.0, n_steps, n_paths, rng), ej::core::InvalidSimulationCount);
  EXPECT_THROW(ej::core::PriceMatrix(max / 2, 3), ej::core::InvalidSimulationCount);
}
