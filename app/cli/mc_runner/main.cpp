#include <ej/market/option_contract.hpp>
#include <ej/config/mc_config.hpp>
#include <ej/pricing/european_option.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <cstdint>
#include <exception>

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " S0 K r q sigma T [n_paths] [seed] [--put] [--model TAG]\n";
}

int main(int argc, char** argv) {
  if (argc < 7) {
    print_usage(argv[0]);
    return 1;
  }

  double S0, K, r, q, sigma, T;
  std::size_t n_paths = 100'000;
  std::uint32_t seed = ej::core::RandomStream::kDefaultSeed;
  bool is_put = false;
  std::string model_name = "MonteCarlo";

  try {
    S0    = std::stod(argv[1]);
    K     = std::stod(argv[2]);
    r     = std::stod(argv[3]);
    q     = std::stod(argv[4]);
    sigma = std::stod(argv[5]);
    T     = std::stod(argv[6]);

    int pos = 0; // positionnels optionnels : n_paths puis seed
    for (int i = 7; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--put") {
        is_put = true;
      } else if (arg == "--model" && i + 1 < argc) {
        model_name = argv[++i];
      } else if (arg.rfind("--model=", 0) == 0) {
        model_name = arg.substr(8);
      } else if (pos == 0) {
        n_paths = static_cast<std::size_t>(std::stoull(arg));
        ++pos;
      } else if (pos == 1) {
        seed = ej::config::parse_seed(arg);
        ++pos;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::logic_error&) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const ej::market::OptionContract contract(
        is_put ? ej::market::OptionType::Put : ej::market::OptionType::Call,
        S0, K, T, r, q, sigma, ej::market::parse_model_tag(model_name));

    const auto option = ej::pricing::EuropeanOption::monte_carlo(
        contract, ej::config::MonteCarloParameters(n_paths, seed));

    const auto res = option.run();

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << option.describe() << "\n"
              << "price         : " << res.price      << "\n"
              << "std_error     : " << res.std_error  << "\n"
              << "ci_low        : " << res.ci_low     << "\n"
              << "ci_high       : " << res.ci_high    << "\n"
              << "n_paths       : " << res.n_paths    << "\n"
              << "seed          : " << seed           << "\n"
              << "elapsed_ms    : " << res.elapsed_ms << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }

  return 0;
}
