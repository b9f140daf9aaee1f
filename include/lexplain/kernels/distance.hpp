#pragma once

/** \file distance.hpp
 *  \brief Scalar distance and proximity kernels over neighborhood rows.
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Zero vectors have cosine similarity 0 with everything (distance 1).
 * Determinism: pure functions, no exceptions.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace lexplain::kernels {

/** \brief Scale applied to neighborhood cosine distances. */
inline constexpr double kDistanceScale = 100.0;

/** \brief Squared L2 norm, accumulated in double. O(d). */
inline double squared_norm(std::span<const float> a) noexcept {
  double acc = 0.0;
  for (float v : a) acc += static_cast<double>(v) * v;
  return acc;
}

/** \brief Cosine similarity (a·b) / (||a|| * ||b||), accumulated in double. O(d). */
inline double cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  double dot = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) dot += static_cast<double>(a[i]) * b[i];
  const double na = squared_norm(a);
  const double nb = squared_norm(b);
  if (na == 0.0 || nb == 0.0) return 0.0;
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

/** \brief Cosine distance 1 - cosine_similarity(a,b), clipped to [0, 2]. O(d). */
inline double cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return std::clamp(1.0 - cosine_similarity(a, b), 0.0, 2.0);
}

/** \brief Scaled cosine distance of every row of a row-major matrix to row 0.
 *
 * \param data Matrix values [rows x cols], row-major
 * \return rows distances, each cosine_distance(row0, row_i) * kDistanceScale;
 *         entry 0 is exactly 0
 *
 * The norm of row 0 is computed once.
 * Complexity: O(rows * cols)
 */
inline std::vector<double> distances_to_first_row(std::span<const float> data,
                                                  std::size_t rows, std::size_t cols) {
  std::vector<double> out(rows, 0.0);
  if (rows == 0) return out;
  const auto origin = data.subspan(0, cols);
  const double origin_norm = std::sqrt(squared_norm(origin));
  for (std::size_t r = 1; r < rows; ++r) {
    const auto row = data.subspan(r * cols, cols);
    double dot = 0.0;
    for (std::size_t c = 0; c < cols; ++c) dot += static_cast<double>(origin[c]) * row[c];
    const double row_norm = std::sqrt(squared_norm(row));
    const double sim = (origin_norm == 0.0 || row_norm == 0.0) ? 0.0 : dot / (origin_norm * row_norm);
    out[r] = std::clamp(1.0 - sim, 0.0, 2.0) * kDistanceScale;
  }
  return out;
}

/** \brief Exponential proximity kernel sqrt(exp(-d^2 / width^2)).
 *
 * Maps a scaled distance to a sample weight in (0, 1]; weight 1 at d == 0.
 * Precondition: width > 0.
 */
inline double exponential_kernel(double distance, double width) noexcept {
  return std::sqrt(std::exp(-(distance * distance) / (width * width)));
}

} // namespace lexplain::kernels
