#include <ej/core/random_stream.hpp>
#include <ej/core/errors.hpp>

#include <random>   // std::mt19937
#include <memory>   // std::make_unique
#include <cmath>    // std::sqrt, std::log, std::exp, std::floor, std::fabs

namespace ej {
namespace core {

namespace {

// log Gamma(x) par série de Stirling (utilisé par PTRS uniquement).
double log_gamma(double x) {
  static constexpr double a[10] = {
      8.333333333333333e-02, -2.777777777777778e-03,
      7.936507936507937e-04, -5.952380952380952e-04,
      8.417508417508418e-04, -1.917526917526918e-03,
      6.410256410256410e-03, -2.955065359477124e-02,
      1.796443723688307e-01, -1.39243221690590e+00};

  if (x == 1.0 || x == 2.0) {
    return 0.0;
  }
  std::int64_t n = 0;
  if (x < 7.0) {
    n = static_cast<std::int64_t>(7 - x);
  }
  double x0 = x + static_cast<double>(n);
  const double x2 = (1.0 / x0) * (1.0 / x0);
  const double lg2pi = 1.8378770664093453e+00; // log(2*pi)
  double gl0 = a[9];
  for (int k = 8; k >= 0; --k) {
    gl0 *= x2;
    gl0 += a[k];
  }
  double gl = gl0 / x0 + 0.5 * lg2pi + (x0 - 0.5) * std::log(x0) - x0;
  if (x < 7.0) {
    for (std::int64_t k = 1; k <= n; ++k) {
      gl -= std::log(x0 - 1.0);
      x0 -= 1.0;
    }
  }
  return gl;
}

} // anonymous namespace

// --- PIMPL -------------------------------------------------------------------

struct RandomStream::Impl {
  std::mt19937 eng;
  bool   has_spare = false; // méthode polaire : 2e variable en réserve
  double spare     = 0.0;

  explicit Impl(std::uint32_t seed) : eng(seed) {}

  double next_double() {
    const std::uint32_t a = static_cast<std::uint32_t>(eng()) >> 5;
    const std::uint32_t b = static_cast<std::uint32_t>(eng()) >> 6;
    return (a * 67108864.0 + b) / 9007199254740992.0;
  }

  double gauss() {
    if (has_spare) {
      has_spare = false;
      const double z = spare;
      spare = 0.0;
      return z;
    }
    double x1, x2, r2;
    do {
      x1 = 2.0 * next_double() - 1.0;
      x2 = 2.0 * next_double() - 1.0;
      r2 = x1 * x1 + x2 * x2;
    } while (r2 >= 1.0 || r2 == 0.0);
    const double f = std::sqrt(-2.0 * std::log(r2) / r2);
    spare     = f * x1;
    has_spare = true;
    return f * x2;
  }

  std::int64_t poisson_mult(double lambda) {
    const double enlam = std::exp(-lambda);
    std::int64_t k = 0;
    double prod = 1.0;
    while (true) {
      prod *= next_double();
      if (prod > enlam) {
        ++k;
      } else {
        return k;
      }
    }
  }

  std::int64_t poisson_ptrs(double lambda) {
    const double slam     = std::sqrt(lambda);
    const double loglam   = std::log(lambda);
    const double b        = 0.931 + 2.53 * slam;
    const double a        = -0.059 + 0.02483 * b;
    const double invalpha = 1.1239 + 1.1328 / (b - 3.4);
    const double vr       = 0.9277 - 3.6224 / (b - 2);

    while (true) {
      const double U  = next_double() - 0.5;
      const double V  = next_double();
      const double us = 0.5 - std::fabs(U);
      const std::int64_t k =
          static_cast<std::int64_t>(std::floor((2 * a / us + b) * U + lambda + 0.43));
      if (us >= 0.07 && V <= vr) {
        return k;
      }
      if (k < 0 || (us < 0.013 && V > us)) {
        continue;
      }
      if ((std::log(V) + std::log(invalpha) - std::log(a / (us * us) + b)) <=
          (-lambda + static_cast<double>(k) * loglam - log_gamma(static_cast<double>(k) + 1.0))) {
        return k;
      }
    }
  }
};

// --- Ctors / Dtors -----------------------------------------------------------

RandomStream::RandomStream()
    : pimpl_(std::make_unique<Impl>(kDefaultSeed)), seed_(kDefaultSeed) {}

RandomStream::RandomStream(std::uint32_t seed)
    : pimpl_(std::make_unique<Impl>(seed)), seed_(seed) {}

RandomStream::RandomStream(const RandomStream& other)
    : pimpl_(std::make_unique<Impl>(other.seed_)), seed_(other.seed_) {}

RandomStream& RandomStream::operator=(const RandomStream& other) {
  if (this != &other) {
    seed_  = other.seed_;
    pimpl_ = std::make_unique<Impl>(seed_);
  }
  return *this;
}

RandomStream::RandomStream(RandomStream&& other) noexcept
    : pimpl_(std::move(other.pimpl_)), seed_(other.seed_) {}

RandomStream& RandomStream::operator=(RandomStream&& other) noexcept {
  if (this != &other) {
    pimpl_ = std::move(other.pimpl_);
    seed_  = other.seed_;
  }
  return *this;
}

RandomStream::~RandomStream() noexcept = default;

// --- API ---------------------------------------------------------------------

std::uint32_t RandomStream::seed() const noexcept {
  return seed_;
}

double RandomStream::uniform() noexcept {
  return pimpl_->next_double();
}

double RandomStream::normal() noexcept {
  return pimpl_->gauss();
}

std::int64_t RandomStream::poisson(double lambda) {
  if (!(lambda >= 0.0) || !std::isfinite(lambda)) {
    throw InvalidParameter("RandomStream: poisson lambda must be finite and >= 0");
  }
  if (lambda == 0.0) {
    return 0; // aucun tirage consommé
  }
  return (lambda >= 10.0) ? pimpl_->poisson_ptrs(lambda)
                          : pimpl_->poisson_mult(lambda);
}

void RandomStream::normal_block(double* out, std::size_t n) noexcept {
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = pimpl_->gauss();
  }
}

void RandomStream::poisson_block(double lambda, std::int64_t* out, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = poisson(lambda);
  }
}

} // namespace core
} // namespace ej
