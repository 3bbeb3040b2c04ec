/**
 * @file statistics.hpp
 * @brief Pearson/Spearman correlation with two-tailed significance.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <Eigen/Dense>

#include "onabc/core/types.hpp"

namespace onabc::correlation {

/**
 * @brief Correlation of one paired series.
 *
 * `status == InsufficientData` marks too few valid pairs and
 * `status == ComputationError` a structurally undefined statistic (zero
 * variance); in both cases every coefficient is disengaged.
 */
struct CorrelationResult {
  core::Status status{core::Status::Ok};
  std::size_t pairs{};
  std::optional<double> pearson_r{};
  std::optional<double> pearson_p{};
  std::optional<double> spearman_r{};
  std::optional<double> spearman_p{};
  std::string message{};
};

/**
 * @brief Two-tailed p-value of a correlation coefficient under Student's t with n-2 dof.
 * @return 1 for n <= 2, 0 for |r| == 1.
 */
[[nodiscard]] double correlation_p_value(double r, std::size_t n);

/**
 * @brief Sample Pearson correlation; nullopt when either series has zero variance.
 *
 * A series counts as constant when its centered sum of squares is at most
 * 1e-28 * n * mean^2, i.e. its spread is below about 1e-14 of its magnitude.
 */
[[nodiscard]] std::optional<double> pearson(const Eigen::VectorXd& x, const Eigen::VectorXd& y);

/**
 * @brief 1-based ranks with ties assigned their average rank.
 */
[[nodiscard]] Eigen::VectorXd average_ranks(const Eigen::VectorXd& v);

/**
 * @brief Pearson and Spearman statistics for equally sized paired series.
 * @param min_pairs Minimum pair count below which `InsufficientData` is returned.
 */
[[nodiscard]] CorrelationResult correlate_pairs(const Eigen::VectorXd& x, const Eigen::VectorXd& y,
                                                std::size_t min_pairs = 2);

}  // namespace onabc::correlation
