/**
 * @file weather_series.cpp
 * @brief Weather CSV parsing and nearest-sample lookup.
 * @author Watosn
 */

#include "onabc/weather/weather_series.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "onabc/core/csv_utils.hpp"
#include "onabc/core/time_utils.hpp"

namespace onabc::weather {
namespace {

struct AliasSet {
  Covariate covariate;
  std::array<const char*, 4> aliases;
};

const std::array<AliasSet, kCovariateCount>& alias_table() {
  static const std::array<AliasSet, kCovariateCount> table = {{
      {Covariate::Temperature, {{"temperature_c", "temperature", "temp_c", "temp"}}},
      {Covariate::Humidity, {{"relative_humidity_percent", "humidity", "rh", "rel_humid"}}},
      {Covariate::WindSpeed, {{"wind_speed_kmh", "windspeed", "wind_speed", "wind"}}},
      {Covariate::Pressure, {{"pressure_hpa", "pressure", "press", "air_pressure"}}},
  }};
  return table;
}

bool is_timestamp_key(const std::string& key) {
  return key == "timestamp" || key == "datetime" || key == "timestamputc" || key == "datetimeutc";
}

}  // namespace

std::optional<Covariate> recognize_covariate(const std::string& header, const bool exact_only) {
  const std::string key = core::csv::to_lower(core::csv::normalize_header(header));
  const std::string raw = core::csv::to_lower(core::csv::trim(header));
  for (const auto& entry : alias_table()) {
    for (const char* alias : entry.aliases) {
      const std::string a(alias);
      if (exact_only) {
        if (key == a || raw == a) {
          return entry.covariate;
        }
      } else if (key.find(a) != std::string::npos) {
        return entry.covariate;
      }
    }
  }
  return std::nullopt;
}

WeatherSeries::LoadResult WeatherSeries::load(std::istream& in) {
  LoadResult out{};
  if (!in) {
    out.status = core::Status::IoError;
    out.message = "weather input stream is not readable";
    return out;
  }

  std::string line;
  while (std::getline(in, line) && core::csv::trim(line).empty()) {
  }
  if (core::csv::trim(line).empty()) {
    out.status = core::Status::ConfigurationError;
    out.message = "weather input has no header row";
    return out;
  }

  const auto header = core::csv::split_line(line);
  std::vector<std::string> keys;
  keys.reserve(header.size());
  for (const auto& h : header) {
    keys.push_back(core::csv::to_lower(core::csv::normalize_header(h)));
  }

  std::optional<std::size_t> ts_col{};
  for (std::size_t i = 0; i < keys.size() && !ts_col.has_value(); ++i) {
    if (is_timestamp_key(keys[i])) {
      ts_col = i;
    }
  }
  for (std::size_t i = 0; i < keys.size() && !ts_col.has_value(); ++i) {
    if (keys[i].find("time") != std::string::npos || keys[i].find("date") != std::string::npos) {
      ts_col = i;
    }
  }
  if (!ts_col.has_value()) {
    out.status = core::Status::ConfigurationError;
    out.message = "weather input has no timestamp column";
    return out;
  }

  // Column index per covariate; the first matching column wins.
  std::array<std::optional<std::size_t>, kCovariateCount> cols{};
  for (const bool exact : {true, false}) {
    for (std::size_t i = 0; i < header.size(); ++i) {
      if (i == *ts_col) {
        continue;
      }
      const auto c = recognize_covariate(header[i], exact);
      if (!c.has_value()) {
        continue;
      }
      auto& slot = cols[static_cast<std::size_t>(*c)];
      const bool taken = std::any_of(cols.begin(), cols.end(), [i](const auto& s) { return s == i; });
      if (!slot.has_value() && !taken) {
        slot = i;
      }
    }
  }

  std::vector<std::pair<std::size_t, Covariate>> ordered;
  for (const Covariate c : kAllCovariates) {
    if (const auto& col = cols[static_cast<std::size_t>(c)]) {
      ordered.emplace_back(*col, c);
    }
  }
  std::sort(ordered.begin(), ordered.end());
  for (const auto& entry : ordered) {
    out.series.covariates_.push_back(entry.second);
  }

  while (std::getline(in, line)) {
    if (core::csv::trim(line).empty()) {
      continue;
    }
    const auto fields = core::csv::split_line(line);
    if (*ts_col >= fields.size()) {
      ++out.rows_skipped;
      continue;
    }
    const auto ts = core::time::parse_timestamp(fields[*ts_col]);
    if (!ts.has_value()) {
      ++out.rows_skipped;
      continue;
    }
    WeatherSample s{};
    s.timestamp = *ts;
    for (const Covariate c : kAllCovariates) {
      const auto& col = cols[static_cast<std::size_t>(c)];
      if (col.has_value() && *col < fields.size()) {
        s.values[static_cast<std::size_t>(c)] = core::csv::parse_number(fields[*col]);
      }
    }
    out.series.samples_.push_back(s);
  }

  std::stable_sort(out.series.samples_.begin(), out.series.samples_.end(),
                   [](const WeatherSample& a, const WeatherSample& b) { return a.timestamp < b.timestamp; });
  return out;
}

WeatherSeries::LoadResult WeatherSeries::load_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    LoadResult out{};
    out.status = core::Status::IoError;
    out.message = fmt::format("failed to open weather csv: {}", path.string());
    return out;
  }
  return load(in);
}

const WeatherSample* WeatherSeries::nearest(const core::Timestamp& t, const double tolerance_s) const noexcept {
  if (samples_.empty()) {
    return nullptr;
  }
  const auto it = std::lower_bound(samples_.begin(), samples_.end(), t,
                                   [](const WeatherSample& s, const core::Timestamp& key) { return s.timestamp < key; });

  const WeatherSample* best = nullptr;
  double best_dt = 0.0;
  if (it != samples_.begin()) {
    best = &*(it - 1);
    best_dt = t.utc_seconds - best->timestamp.utc_seconds;
  }
  if (it != samples_.end()) {
    const double dt = it->timestamp.utc_seconds - t.utc_seconds;
    if (best == nullptr || dt < best_dt) {
      best = &*it;
      best_dt = dt;
    }
  }
  if (best == nullptr || std::abs(best_dt) > tolerance_s) {
    return nullptr;
  }
  return best;
}

}  // namespace onabc::weather
