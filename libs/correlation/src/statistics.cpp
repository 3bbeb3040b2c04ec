/**
 * @file statistics.cpp
 * @brief Correlation statistics implementation.
 * @author Watosn
 */

#include "onabc/correlation/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

#include <boost/math/distributions/students_t.hpp>
#include <fmt/format.h>

namespace onabc::correlation {
namespace {

// Spread below 1e-14 of the mean magnitude, a few dozen ulp, is rounding residue of a constant series.
constexpr double kRelativeVarianceFloor = 1e-28;

bool has_variance(const Eigen::VectorXd& v, const double centered_sum_squares) {
  const double mean = v.mean();
  return centered_sum_squares > kRelativeVarianceFloor * static_cast<double>(v.size()) * mean * mean;
}

}  // namespace

double correlation_p_value(const double r, const std::size_t n) {
  if (n <= 2U) {
    return 1.0;
  }
  const double r2 = std::min(r * r, 1.0);
  if (r2 >= 1.0) {
    return 0.0;
  }
  const double df = static_cast<double>(n - 2U);
  const double t = std::abs(r) * std::sqrt(df / (1.0 - r2));
  const boost::math::students_t dist(df);
  return std::clamp(2.0 * boost::math::cdf(boost::math::complement(dist, t)), 0.0, 1.0);
}

std::optional<double> pearson(const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
  if (x.size() != y.size() || x.size() < 2) {
    return std::nullopt;
  }
  const Eigen::VectorXd xc = (x.array() - x.mean()).matrix();
  const Eigen::VectorXd yc = (y.array() - y.mean()).matrix();
  const double sxx = xc.squaredNorm();
  const double syy = yc.squaredNorm();
  if (!has_variance(x, sxx) || !has_variance(y, syy)) {
    return std::nullopt;
  }
  const double r = xc.dot(yc) / std::sqrt(sxx * syy);
  if (!std::isfinite(r)) {
    return std::nullopt;
  }
  return std::clamp(r, -1.0, 1.0);
}

Eigen::VectorXd average_ranks(const Eigen::VectorXd& v) {
  const auto n = static_cast<std::size_t>(v.size());
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), 0U);
  std::stable_sort(order.begin(), order.end(), [&v](const std::size_t a, const std::size_t b) {
    return v(static_cast<Eigen::Index>(a)) < v(static_cast<Eigen::Index>(b));
  });

  Eigen::VectorXd ranks(v.size());
  std::size_t i = 0;
  while (i < n) {
    std::size_t j = i + 1;
    while (j < n && v(static_cast<Eigen::Index>(order[j])) == v(static_cast<Eigen::Index>(order[i]))) {
      ++j;
    }
    const double avg = 0.5 * static_cast<double>(i + 1 + j);
    for (std::size_t k = i; k < j; ++k) {
      ranks(static_cast<Eigen::Index>(order[k])) = avg;
    }
    i = j;
  }
  return ranks;
}

CorrelationResult correlate_pairs(const Eigen::VectorXd& x, const Eigen::VectorXd& y, const std::size_t min_pairs) {
  CorrelationResult out{};
  if (x.size() != y.size()) {
    out.status = core::Status::ComputationError;
    out.message = fmt::format("paired series differ in length ({} vs {})", x.size(), y.size());
    return out;
  }
  out.pairs = static_cast<std::size_t>(x.size());
  if (out.pairs < std::max<std::size_t>(min_pairs, 2U)) {
    out.status = core::Status::InsufficientData;
    out.message = fmt::format("insufficient data: {} valid pairs", out.pairs);
    return out;
  }

  const auto r = pearson(x, y);
  if (!r.has_value()) {
    out.status = core::Status::ComputationError;
    out.message = "correlation undefined: zero variance in one series";
    return out;
  }
  const auto rs = pearson(average_ranks(x), average_ranks(y));
  if (!rs.has_value()) {
    out.status = core::Status::ComputationError;
    out.message = "rank correlation undefined: zero rank variance";
    return out;
  }

  out.pearson_r = *r;
  out.pearson_p = correlation_p_value(*r, out.pairs);
  out.spearman_r = *rs;
  out.spearman_p = correlation_p_value(*rs, out.pairs);
  return out;
}

}  // namespace onabc::correlation
