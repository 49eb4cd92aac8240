#pragma once
/**
 * @file price_matrix.hpp
 * @brief Matrice de prix simulés (rows × cols), stockage contigu row-major.
 *
 * - Ligne t : date t du calendrier (0 = spot, rows-1 = maturité).
 * - Colonne j : trajectoire j.
 *
 * Un appel d’échantillonnage produit sa propre matrice et la rend par valeur :
 * aucune instance n’est partagée entre appels.
 */

#include <cstddef>   // std::size_t
#include <limits>    // std::numeric_limits
#include <vector>

#include <ej/core/errors.hpp>

namespace ej {
namespace core {

class PriceMatrix {
public:
  /**
   * @brief Matrice rows × cols initialisée à `fill`.
   * @throws InvalidSimulationCount si rows * cols dépasse std::size_t.
   */
  PriceMatrix(std::size_t rows, std::size_t cols, double fill = 0.0)
      : rows_(rows), cols_(cols), data_(checked_size(rows, cols), fill) {}

  std::size_t rows() const noexcept { return rows_; }
  std::size_t cols() const noexcept { return cols_; }

  double& at(std::size_t t, std::size_t j) noexcept { return data_[index(t, j)]; }
  double  at(std::size_t t, std::size_t j) const noexcept { return data_[index(t, j)]; }

  /// @brief Début de la ligne t (cols() éléments contigus).
  double*       row(std::size_t t) noexcept { return data_.data() + t * cols_; }
  const double* row(std::size_t t) const noexcept { return data_.data() + t * cols_; }

  /// @brief Copie de la dernière ligne (prix à maturité).
  std::vector<double> terminal_row() const {
    if (rows_ == 0) return {};
    const double* last = row(rows_ - 1);
    return std::vector<double>(last, last + cols_);
  }

  /// @brief Accès brut au buffer (rows*cols valeurs).
  const std::vector<double>& data() const noexcept { return data_; }

private:
  std::size_t rows_;
  std::size_t cols_;
  std::vector<double> data_;

  static std::size_t checked_size(std::size_t rows, std::size_t cols) {
    if (rows != 0 && cols > std::numeric_limits<std::size_t>::max() / rows) {
      throw InvalidSimulationCount("PriceMatrix: rows * cols overflows std::size_t");
    }
    return rows * cols;
  }

  std::size_t index(std::size_t t, std::size_t j) const noexcept {
    return t * cols_ + j;
  }
};

} // namespace core
} // namespace ej
