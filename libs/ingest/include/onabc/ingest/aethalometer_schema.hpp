/**
 * @file aethalometer_schema.hpp
 * @brief Column-role binding for aethalometer CSV exports.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "onabc/core/types.hpp"

namespace onabc::ingest {

/**
 * @brief Required column roles bound to row positions, resolved once per input.
 *
 * The timestamp comes either from a single combined column or from a
 * date/time column pair (AE33/MA350 "Date local" + "Time local").
 */
struct AethalometerSchema {
  core::Channel channel{core::Channel::Blue};
  std::size_t attenuation_col{};
  std::size_t concentration_col{};
  std::optional<std::size_t> timestamp_col{};
  std::optional<std::size_t> date_col{};
  std::optional<std::size_t> time_col{};
  std::string attenuation_name{};
  std::string concentration_name{};
  std::size_t column_count{};
};

/**
 * @brief Outcome of schema resolution.
 */
struct SchemaResult {
  AethalometerSchema schema{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Bind column roles from raw header fields.
 * @param header Raw header fields (normalized internally).
 * @param channel Selected wavelength channel.
 * @return `ConfigurationError` when the channel or timestamp columns are absent.
 */
[[nodiscard]] SchemaResult resolve_schema(const std::vector<std::string>& header, core::Channel channel);

}  // namespace onabc::ingest
