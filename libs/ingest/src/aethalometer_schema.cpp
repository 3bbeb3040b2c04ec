/**
 * @file aethalometer_schema.cpp
 * @brief Column-role binding for aethalometer CSV exports.
 * @author Watosn
 */

#include "onabc/ingest/aethalometer_schema.hpp"

#include <array>
#include <string>

#include <fmt/format.h>

#include "onabc/core/csv_utils.hpp"

namespace onabc::ingest {
namespace {

constexpr std::array<const char*, 5> kTimestampNames = {"timestamp", "datetime", "timestamputc", "datetimeutc",
                                                        "datetimelocal"};

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& s, const std::string& needle) { return s.find(needle) != std::string::npos; }

std::optional<std::size_t> find_exact(const std::vector<std::string>& keys, const std::string& wanted) {
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (keys[i] == wanted) {
      return i;
    }
  }
  return std::nullopt;
}

// Fallback for exports that decorate spot-1 columns ("blueAtn1Raw", "blueBc1Corrected").
std::optional<std::size_t> find_channel_column(const std::vector<std::string>& keys, const std::string& channel,
                                               const std::string& token, const std::string& excluded) {
  if (const auto exact = find_exact(keys, channel + token + "1")) {
    return exact;
  }
  for (std::size_t i = 0; i < keys.size(); ++i) {
    const std::string& k = keys[i];
    if (starts_with(k, channel) && contains(k, token) && contains(k, "1") && (excluded.empty() || !contains(k, excluded))) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace

SchemaResult resolve_schema(const std::vector<std::string>& header, const core::Channel channel) {
  SchemaResult out{};
  out.schema.channel = channel;
  out.schema.column_count = header.size();

  std::vector<std::string> keys;
  keys.reserve(header.size());
  for (const auto& h : header) {
    keys.push_back(core::csv::to_lower(core::csv::normalize_header(h)));
  }

  const std::string ch = core::csv::to_lower(core::channel_to_string(channel));
  const auto atn = find_channel_column(keys, ch, "atn", "");
  const auto bc = find_channel_column(keys, ch, "bc", "atn");
  if (!atn.has_value() || !bc.has_value()) {
    out.status = core::Status::ConfigurationError;
    out.message = fmt::format("Could not find {} ATN and BC columns", core::channel_to_string(channel));
    return out;
  }
  out.schema.attenuation_col = *atn;
  out.schema.concentration_col = *bc;
  out.schema.attenuation_name = header[*atn];
  out.schema.concentration_name = header[*bc];

  for (const char* name : kTimestampNames) {
    if (const auto idx = find_exact(keys, name)) {
      out.schema.timestamp_col = idx;
      return out;
    }
  }

  std::optional<std::size_t> date_col{};
  std::optional<std::size_t> time_col{};
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (!date_col.has_value() && starts_with(keys[i], "date")) {
      date_col = i;
    }
  }
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (!time_col.has_value() && contains(keys[i], "time") && contains(keys[i], "local")) {
      time_col = i;
    }
  }
  if (!time_col.has_value()) {
    for (std::size_t i = 0; i < keys.size(); ++i) {
      if (starts_with(keys[i], "time") && (!date_col.has_value() || *date_col != i)) {
        time_col = i;
        break;
      }
    }
  }
  if (!date_col.has_value() || !time_col.has_value() || *date_col == *time_col) {
    out.status = core::Status::ConfigurationError;
    out.message = "No timestamp column found (expected 'timestamp' or a 'Date local'/'Time local' pair)";
    return out;
  }
  out.schema.date_col = date_col;
  out.schema.time_col = time_col;
  return out;
}

}  // namespace onabc::ingest
