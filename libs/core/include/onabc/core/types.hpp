/**
 * @file types.hpp
 * @brief Core domain types for onabc.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace onabc::core {

/**
 * @brief Standard status code carried by stage results.
 *
 * `ParsingError` is row-level and never fatal; `InsufficientData` and
 * `ComputationError` are per-covariate; the remaining errors end a job.
 */
enum class Status : std::uint8_t {
  Ok,
  ConfigurationError,
  ParsingError,
  DataQualityError,
  ComputationError,
  InsufficientData,
  IoError
};

/**
 * @brief Stable lowercase name for a status code.
 */
inline const char* status_to_string(const Status s) {
  switch (s) {
    case Status::Ok:
      return "ok";
    case Status::ConfigurationError:
      return "configuration_error";
    case Status::ParsingError:
      return "parsing_error";
    case Status::DataQualityError:
      return "data_quality_error";
    case Status::ComputationError:
      return "computation_error";
    case Status::InsufficientData:
      return "insufficient_data";
    case Status::IoError:
      return "io_error";
    default:
      return "unknown";
  }
}

/**
 * @brief UTC instant expressed as seconds since Unix epoch.
 */
struct Timestamp {
  double utc_seconds{};
};

inline bool operator==(const Timestamp& a, const Timestamp& b) { return a.utc_seconds == b.utc_seconds; }
inline bool operator<(const Timestamp& a, const Timestamp& b) { return a.utc_seconds < b.utc_seconds; }
inline bool operator<=(const Timestamp& a, const Timestamp& b) { return a.utc_seconds <= b.utc_seconds; }

/**
 * @brief Aethalometer wavelength channel.
 */
enum class Channel : std::uint8_t { UV, Blue, Green, Red, IR };

/**
 * @brief Canonical display name of a channel ("UV", "Blue", ...).
 */
inline const char* channel_to_string(const Channel c) {
  switch (c) {
    case Channel::UV:
      return "UV";
    case Channel::Blue:
      return "Blue";
    case Channel::Green:
      return "Green";
    case Channel::Red:
      return "Red";
    case Channel::IR:
      return "IR";
    default:
      return "unknown";
  }
}

/**
 * @brief Case-insensitive channel lookup; nullopt for names outside the enumerated set.
 */
inline std::optional<Channel> parse_channel(const std::string& name) {
  std::string lower;
  lower.reserve(name.size());
  for (const char c : name) {
    lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
  }
  if (lower == "uv") {
    return Channel::UV;
  }
  if (lower == "blue") {
    return Channel::Blue;
  }
  if (lower == "green") {
    return Channel::Green;
  }
  if (lower == "red") {
    return Channel::Red;
  }
  if (lower == "ir") {
    return Channel::IR;
  }
  return std::nullopt;
}

/**
 * @brief One validated sensor reading for a single wavelength channel.
 */
struct Reading {
  Timestamp timestamp{};
  double attenuation{};
  std::optional<double> raw_bc{};
};

/**
 * @brief One closed ONA window.
 *
 * `timestamp` and `raw_bc` come from the last reading in the window,
 * `processed_bc` is the mean of the raw values present and `attenuation`
 * is the closing attenuation.
 */
struct ProcessedRecord {
  Timestamp timestamp{};
  std::optional<double> raw_bc{};
  std::optional<double> processed_bc{};
  std::optional<double> attenuation{};
  std::size_t window_size{};
  bool trailing{};
};

/**
 * @brief Progress notification published to the job-tracking collaborator.
 */
struct ProgressEvent {
  int percent{};
  std::string message{};
  bool terminal{};
};

}  // namespace onabc::core
