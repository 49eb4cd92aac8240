#include <gtest/gtest.h>

#include <ej/core/errors.hpp>
#include <ej/pricing/european_option.hpp>
#include <ej/pricing/jump_pricer.hpp>
#include <ej/pricing/mc_pricer.hpp>
#include <ej/models/merton_jump.hpp>

#include <cmath>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

using ej::config::JumpDiffusionParameters;
using ej::config::MonteCarloParameters;
using ej::market::OptionContract;
using ej::pricing::EuropeanOption;

namespace {

OptionContract contract(const char* type, const char* model, double sigma = 0.2) {
  return OptionContract(type, 100.0, 100.0, 1.0, 0.0, 0.0, sigma, model);
}

} // namespace

TEST(EuropeanOptionTest, PlainMonteCarloReferenceValue) {
  const auto opt = EuropeanOption::monte_carlo(contract("call", "MonteCarlo"));
  EXPECT_NEAR(opt.value(), 7.9797504, 1e-6);
}

TEST(EuropeanOptionTest, JumpDiffusionReferenceValue) {
  const auto opt = EuropeanOption::jump_diffusion(contract("call", "JumpDiffusion"),
                                                  JumpDiffusionParameters(1.0, -0.2, 0.2, 100));
  EXPECT_NEAR(opt.value(), 12.4927219, 1e-6);
}

TEST(EuropeanOptionTest, ValueIsRecomputedIdentically) {
  const auto opt = EuropeanOption::jump_diffusion(contract("put", "JumpDiffusion"),
                                                  JumpDiffusionParameters(0.5, 0.1, 0.3, 25, 2000));
  const double v1 = opt.value();
  const double v2 = opt.value();
  EXPECT_EQ(v1, v2);
  EXPECT_EQ(opt.run().price, v1);
}

TEST(EuropeanOptionTest, DescribeNamesTheModel) {
  const auto mc = EuropeanOption::monte_carlo(contract("call", "MonteCarlo"), MonteCarloParameters(10));
  EXPECT_EQ(mc.describe(), "This EuropeanOption is priced using MonteCarlo");
  const auto jd = EuropeanOption::jump_diffusion(contract("call", "JumpDiffusion"),
                                                 JumpDiffusionParameters(1.0, -0.2, 0.2, 10, 10));
  EXPECT_EQ(jd.describe(), "This EuropeanOption is priced using JumpDiffusion");
}

TEST(EuropeanOptionTest, CallValueIncreasesWithVolatility) {
  for (std::uint32_t seed : {1u, 2u, 3u, 4u, 5u}) {
    const MonteCarloParameters mp(20000, seed);
    const double low  = EuropeanOption::monte_carlo(contract("call", "MonteCarlo", 0.2), mp).value();
    const double high = EuropeanOption::monte_carlo(contract("call", "MonteCarlo", 0.3), mp).value();
    EXPECT_GT(high, low) << "seed " << seed;
  }
}

TEST(EuropeanOptionTest, PutCallParityAtTheMoneyZeroRates) {
  const auto call = EuropeanOption::monte_carlo(contract("call", "MonteCarlo")).run();
  const auto put  = EuropeanOption::monte_carlo(contract("put", "MonteCarlo")).run();
  EXPECT_NEAR(call.price, put.price, 3.0 * (call.std_error + put.std_error));
}

// C - P = e^{-rT} (moyenne(S_T) - K) sur les mêmes trajectoires.
TEST(EuropeanOptionTest, JumpDiffusionCallMinusPutIsForwardGap) {
  const OptionContract c("call", 100.0, 95.0, 1.0, 0.05, 0.0, 0.2, "JumpDiffusion");
  const OptionContract p("put", 100.0, 95.0, 1.0, 0.05, 0.0, 0.2, "JumpDiffusion");
  const JumpDiffusionParameters jp(1.0, -0.2, 0.2, 50, 4000);

  const auto ST = ej::models::simulate_paths(c, jp).terminal_row();
  double sum = 0.0;
  for (double s : ST) sum += s;
  const double gap = std::exp(-0.05) * (sum / static_cast<double>(ST.size()) - 95.0);

  const double cv = EuropeanOption::jump_diffusion(c, jp).value();
  const double pv = EuropeanOption::jump_diffusion(p, jp).value();
  EXPECT_NEAR(cv - pv, gap, 1e-8);
}

TEST(EuropeanOptionTest, BoundaryInputsFailWithDocumentedKinds) {
  EXPECT_THROW(OptionContract("call", 100.0, 100.0, 0.0, 0.0, 0.0, 0.2, "MonteCarlo"),
               ej::core::InvalidParameter);
  EXPECT_THROW(MonteCarloParameters(0), ej::core::InvalidSimulationCount);
  EXPECT_THROW(JumpDiffusionParameters(1.0, -0.2, 0.2, 100, 0), ej::core::InvalidSimulationCount);
  EXPECT_THROW(OptionContract("call", 100.0, 100.0, 1.0, 0.0, 0.0, 0.2, "Garch"),
               ej::core::UnknownModel);
}

TEST(EuropeanOptionTest, ModelMismatchFailsAtConstruction) {
  EXPECT_THROW(EuropeanOption::monte_carlo(contract("call", "JumpDiffusion")),
               ej::core::UnknownModel);
  EXPECT_THROW(EuropeanOption::jump_diffusion(contract("call", "MonteCarlo"),
                                              JumpDiffusionParameters(1.0, -0.2, 0.2, 10)),
               ej::core::UnknownModel);
  EXPECT_THROW(EuropeanOption::monte_carlo(contract("call", "BlackScholes")),
               ej::core::UnknownModel);
  EXPECT_THROW(EuropeanOption(contract("call", "MonteCarlo"), nullptr), ej::core::UnknownModel);
}

TEST(EuropeanOptionTest, SharedPricerIsSafeAcrossThreads) {
  const auto pricer = std::make_shared<ej::pricing::JumpDiffusionPricer>(
      JumpDiffusionParameters(1.0, -0.2, 0.2, 20, 2000, 8u));
  const auto c = contract("call", "JumpDiffusion");
  const double serial = pricer->price(c);

  std::vector<double> out(4, 0.0);
  std::vector<std::thread> workers;
  for (std::size_t i = 0; i < out.size(); ++i) {
    workers.emplace_back([&, i] { out[i] = pricer->price(c); });
  }
  for (auto& w : workers) w.join();
  for (double v : out) {
    EXPECT_EQ(v, serial);
  }
}

TEST(EuropeanOptionTest, RunReportsPathCount) {
  const auto res = EuropeanOption::monte_carlo(contract("put", "MonteCarlo"),
                                               MonteCarloParameters(5000, 3u)).run();
  EXPECT_EQ(res.n_paths, 5000u);
  EXPECT_GT(res.std_error, 0.0);
  EXPECT_LE(res.ci_low, res.price);
  EXPECT_GE(res.ci_high, res.price);
  EXPECT_GE(res.elapsed_ms, 0);
}

TEST(EuropeanOptionTest, PricersRejectContractsOfAnotherModel) {
  const ej::pricing::McPricer mc(MonteCarloParameters(100));
  const ej::pricing::JumpDiffusionPricer jd(JumpDiffusionParameters(1.0, -0.2, 0.2, 5, 100));
  for (const char* tag : {"BlackScholes", "BinomialTree", "JumpDiffusion"}) {
    EXPECT_THROW(mc.price(contract("call", tag)), ej::core::UnknownModel) << tag;
  }
  for (const char* tag : {"BlackScholes", "BinomialTree", "MonteCarlo"}) {
    EXPECT_THROW(jd.price_european(contract("put", tag)), ej::core::UnknownModel) << tag;
  }
  EXPECT_NO_THROW(mc.price(contract("call", "MonteCarlo")));
  EXPECT_NO_THROW(jd.price(contract("call", "JumpDiffusion")));
}
