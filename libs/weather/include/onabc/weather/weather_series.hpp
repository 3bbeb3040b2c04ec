/**
 * @file weather_series.hpp
 * @brief Weather covariate series backed by a CSV export.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "onabc/core/types.hpp"

namespace onabc::weather {

/**
 * @brief Known covariate set; columns outside it are ignored.
 */
enum class Covariate : std::uint8_t { Temperature, Humidity, WindSpeed, Pressure };

constexpr std::size_t kCovariateCount = 4;

constexpr std::array<Covariate, kCovariateCount> kAllCovariates = {Covariate::Temperature, Covariate::Humidity,
                                                                   Covariate::WindSpeed, Covariate::Pressure};

inline const char* covariate_to_string(const Covariate c) {
  switch (c) {
    case Covariate::Temperature:
      return "temperature";
    case Covariate::Humidity:
      return "humidity";
    case Covariate::WindSpeed:
      return "windSpeed";
    case Covariate::Pressure:
      return "pressure";
    default:
      return "unknown";
  }
}

/**
 * @brief Map a raw header to a known covariate by alias.
 *
 * Exact alias matches are checked before substring matches so that
 * "wind_speed_kmh" is not shadowed by an earlier "wind_direction" column.
 */
[[nodiscard]] std::optional<Covariate> recognize_covariate(const std::string& header, bool exact_only);

/**
 * @brief One weather observation; absent covariates stay disengaged.
 */
struct WeatherSample {
  core::Timestamp timestamp{};
  std::array<std::optional<double>, kCovariateCount> values{};

  [[nodiscard]] const std::optional<double>& value(const Covariate c) const {
    return values[static_cast<std::size_t>(c)];
  }
};

/**
 * @brief Time-ordered weather samples with nearest-in-time lookup.
 */
class WeatherSeries {
 public:
  /**
   * @brief Outcome of parsing a weather CSV.
   */
  struct LoadResult;

  static LoadResult load(std::istream& in);
  static LoadResult load_file(const std::filesystem::path& path);

  [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
  [[nodiscard]] const std::vector<WeatherSample>& samples() const noexcept { return samples_; }
  /**
   * @brief Covariates recognized in the header, in header order.
   */
  [[nodiscard]] const std::vector<Covariate>& covariates() const noexcept { return covariates_; }

  /**
   * @brief Sample nearest to `t` within `tolerance_s`; ties resolve to the earlier sample.
   * @return Pointer into the series, or nullptr when no sample lies within tolerance.
   */
  [[nodiscard]] const WeatherSample* nearest(const core::Timestamp& t, double tolerance_s) const noexcept;

 private:
  std::vector<WeatherSample> samples_{};
  std::vector<Covariate> covariates_{};
};

struct WeatherSeries::LoadResult {
  WeatherSeries series{};
  core::Status status{core::Status::Ok};
  std::string message{};
  std::size_t rows_skipped{};
};

}  // namespace onabc::weather
