/**
 * @file correlation_engine.cpp
 * @brief Weather covariate join and correlation implementation.
 * @author Watosn
 */

#include "onabc/correlation/correlation_engine.hpp"

#include <cmath>
#include <vector>

#include <Eigen/Dense>
#include <fmt/format.h>

namespace onabc::correlation {
namespace {

Eigen::VectorXd to_vector(const std::vector<double>& v) {
  return Eigen::Map<const Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

}  // namespace

core::Status CorrelationEngine::validate(const Config& config, std::string* message) {
  if (!std::isfinite(config.tolerance_s) || config.tolerance_s < 0.0) {
    if (message != nullptr) {
      *message = fmt::format("tolerance_s must be finite and >= 0, got {}", config.tolerance_s);
    }
    return core::Status::ConfigurationError;
  }
  if (config.min_pairs < 2U) {
    if (message != nullptr) {
      *message = fmt::format("min_pairs must be >= 2, got {}", config.min_pairs);
    }
    return core::Status::ConfigurationError;
  }
  return core::Status::Ok;
}

std::map<weather::Covariate, CorrelationResult> CorrelationEngine::correlate(
    const std::vector<core::ProcessedRecord>& records, const weather::WeatherSeries& weather) const {
  std::map<weather::Covariate, CorrelationResult> out;
  if (weather.covariates().empty()) {
    return out;
  }

  // One nearest-sample lookup per record, shared by every covariate.
  std::vector<const weather::WeatherSample*> matched(records.size(), nullptr);
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (records[i].processed_bc.has_value()) {
      matched[i] = weather.nearest(records[i].timestamp, config_.tolerance_s);
    }
  }

  for (const weather::Covariate c : weather.covariates()) {
    std::vector<double> bc;
    std::vector<double> cov;
    bc.reserve(records.size());
    cov.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
      if (matched[i] == nullptr) {
        continue;
      }
      const auto& value = matched[i]->value(c);
      if (!value.has_value()) {
        continue;
      }
      bc.push_back(*records[i].processed_bc);
      cov.push_back(*value);
    }
    out.emplace(c, correlate_pairs(to_vector(cov), to_vector(bc), config_.min_pairs));
  }
  return out;
}

ComparisonResult CorrelationEngine::compare_raw_processed(const std::vector<core::ProcessedRecord>& records) const {
  std::vector<double> raw;
  std::vector<double> processed;
  raw.reserve(records.size());
  processed.reserve(records.size());
  for (const auto& r : records) {
    if (r.raw_bc.has_value() && r.processed_bc.has_value()) {
      raw.push_back(*r.raw_bc);
      processed.push_back(*r.processed_bc);
    }
  }

  ComparisonResult out{};
  out.stats = correlate_pairs(to_vector(raw), to_vector(processed), config_.min_pairs);
  out.data_points = raw.size();
  if (!records.empty()) {
    out.null_percentage =
        (1.0 - static_cast<double>(raw.size()) / static_cast<double>(records.size())) * 100.0;
  }
  return out;
}

}  // namespace onabc::correlation
