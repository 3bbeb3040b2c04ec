/**
 * @file correlation_engine.hpp
 * @brief Joins processed records to weather covariates and correlates them.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "onabc/core/types.hpp"
#include "onabc/correlation/statistics.hpp"
#include "onabc/weather/weather_series.hpp"

namespace onabc::correlation {

/**
 * @brief Raw vs processed BC agreement over the processed record set.
 */
struct ComparisonResult {
  CorrelationResult stats{};
  std::size_t data_points{};
  double null_percentage{};
};

/**
 * @brief Read-only correlation pass over processed records.
 */
class CorrelationEngine final {
 public:
  /**
   * @brief Join and significance configuration.
   */
  struct Config {
    /// Maximum |record time - sample time| for a weather sample to pair with a record.
    double tolerance_s{3600.0};
    std::size_t min_pairs{2};
  };

  [[nodiscard]] static core::Status validate(const Config& config, std::string* message = nullptr);

  explicit CorrelationEngine(Config config) : config_(config) {}

  /**
   * @brief Correlate processed BC against every covariate recognized in `weather`.
   *
   * Each record is paired with the nearest sample within tolerance; pairs with
   * a missing value on either side are excluded. A covariate with too few pairs
   * yields an `InsufficientData` result without affecting the others.
   */
  [[nodiscard]] std::map<weather::Covariate, CorrelationResult> correlate(
      const std::vector<core::ProcessedRecord>& records, const weather::WeatherSeries& weather) const;

  /**
   * @brief Correlate raw BC against processed BC for the same records.
   */
  [[nodiscard]] ComparisonResult compare_raw_processed(const std::vector<core::ProcessedRecord>& records) const;

  [[nodiscard]] const Config& config() const noexcept { return config_; }

 private:
  Config config_{};
};

}  // namespace onabc::correlation
