/**
 * @file aethalometer_csv_source.cpp
 * @brief Chunked aethalometer CSV reading source implementation.
 * @author Watosn
 */

#include "onabc/ingest/aethalometer_csv_source.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "onabc/core/csv_utils.hpp"
#include "onabc/core/time_utils.hpp"

namespace onabc::ingest {
namespace {

// Ingestion (interleaved with ONA) spans this band of the job's progress range.
constexpr int kIngestProgressStart = 5;
constexpr int kIngestProgressSpan = 80;

std::size_t stream_size(std::istream& in) {
  const std::istream::pos_type pos = in.tellg();
  if (pos == std::istream::pos_type(-1)) {
    in.clear();
    return 0U;
  }
  in.seekg(0, std::ios::end);
  const std::istream::pos_type end = in.tellg();
  in.seekg(pos);
  if (end == std::istream::pos_type(-1) || !in) {
    in.clear();
    in.seekg(pos);
    return 0U;
  }
  return static_cast<std::size_t>(end - pos);
}

const std::string* field_at(const std::vector<std::string>& fields, const std::size_t idx) {
  return idx < fields.size() ? &fields[idx] : nullptr;
}

}  // namespace

core::Status AethalometerCsvSource::validate(const Config& config, std::string* message) {
  if (config.chunk_rows == 0U) {
    if (message != nullptr) {
      *message = "chunk_rows must be > 0";
    }
    return core::Status::ConfigurationError;
  }
  return core::Status::Ok;
}

AethalometerCsvSource::OpenResult AethalometerCsvSource::open(std::istream& in, const Config& config,
                                                              core::ProgressReporter* progress) {
  OpenResult out{};
  out.status = validate(config, &out.message);
  if (out.status != core::Status::Ok) {
    return out;
  }
  if (!in) {
    out.status = core::Status::IoError;
    out.message = "aethalometer input stream is not readable";
    return out;
  }

  const std::size_t total_bytes = stream_size(in);
  std::string header_line;
  std::size_t header_bytes = 0;
  while (std::getline(in, header_line)) {
    header_bytes += header_line.size() + 1U;
    if (!core::csv::trim(header_line).empty()) {
      break;
    }
  }
  if (core::csv::trim(header_line).empty()) {
    out.status = core::Status::ConfigurationError;
    out.message = "aethalometer input has no header row";
    return out;
  }

  auto schema = resolve_schema(core::csv::split_line(header_line), config.channel);
  if (schema.status != core::Status::Ok) {
    out.status = schema.status;
    out.message = std::move(schema.message);
    return out;
  }

  out.source = std::unique_ptr<AethalometerCsvSource>(
      new AethalometerCsvSource(in, config, std::move(schema.schema), progress));
  out.source->stats_.total_bytes = total_bytes;
  out.source->stats_.bytes_consumed = header_bytes;
  return out;
}

AethalometerCsvSource::OpenResult AethalometerCsvSource::open_file(const std::filesystem::path& path,
                                                                   const Config& config,
                                                                   core::ProgressReporter* progress) {
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!file->is_open()) {
    return OpenResult{.source = nullptr,
                      .status = core::Status::IoError,
                      .message = fmt::format("failed to open aethalometer csv: {}", path.string())};
  }
  auto out = open(*file, config, progress);
  if (out.source) {
    out.source->owned_ = std::move(file);
  }
  return out;
}

std::optional<core::Reading> AethalometerCsvSource::next() {
  while (chunk_pos_ >= chunk_.size()) {
    if (eof_ || !fill_chunk()) {
      return std::nullopt;
    }
  }
  return chunk_[chunk_pos_++];
}

double AethalometerCsvSource::fraction_consumed() const {
  if (stats_.total_bytes == 0U) {
    return -1.0;
  }
  return std::clamp(static_cast<double>(stats_.bytes_consumed) / static_cast<double>(stats_.total_bytes), 0.0, 1.0);
}

bool AethalometerCsvSource::fill_chunk() {
  chunk_.clear();
  chunk_pos_ = 0;

  std::size_t rows_in_chunk = 0;
  std::size_t skipped_in_chunk = 0;
  std::string line;
  while (rows_in_chunk < config_.chunk_rows) {
    if (!std::getline(in_, line)) {
      eof_ = true;
      break;
    }
    stats_.bytes_consumed += line.size() + 1U;
    if (core::csv::trim(line).empty()) {
      continue;
    }
    ++rows_in_chunk;
    ++stats_.rows_read;

    auto reading = parse_row(line);
    if (!reading.has_value()) {
      ++skipped_in_chunk;
      continue;
    }
    last_timestamp_ = reading->timestamp;
    chunk_.push_back(*reading);
  }
  // A final line without a newline is counted one byte long.
  if (stats_.total_bytes > 0U && stats_.bytes_consumed > stats_.total_bytes) {
    stats_.bytes_consumed = stats_.total_bytes;
  }
  stats_.rows_accepted += chunk_.size();
  stats_.rows_skipped += skipped_in_chunk;

  if (rows_in_chunk == 0U) {
    return false;
  }
  ++stats_.chunks;
  if (progress_ != nullptr) {
    const double frac = fraction_consumed();
    const std::string message = fmt::format("Processing chunk {} ({} rows, {} skipped so far)", stats_.chunks,
                                            stats_.rows_read, stats_.rows_skipped);
    if (frac >= 0.0) {
      progress_->report(kIngestProgressStart + static_cast<int>(frac * kIngestProgressSpan), message);
    } else {
      progress_->note(message);
    }
  }
  return true;
}

std::optional<core::Reading> AethalometerCsvSource::parse_row(const std::string& line) {
  const auto fields = core::csv::split_line(line);

  std::optional<core::Timestamp> ts{};
  if (schema_.timestamp_col.has_value()) {
    if (const auto* f = field_at(fields, *schema_.timestamp_col)) {
      ts = core::time::parse_timestamp(*f);
    }
  } else {
    const auto* d = field_at(fields, *schema_.date_col);
    const auto* t = field_at(fields, *schema_.time_col);
    if (d != nullptr && t != nullptr) {
      ts = core::time::parse_date_and_time(*d, *t);
    }
  }
  if (!ts.has_value()) {
    return std::nullopt;
  }

  const auto* atn_field = field_at(fields, schema_.attenuation_col);
  const auto atn = (atn_field != nullptr) ? core::csv::parse_number(*atn_field) : std::nullopt;
  if (!atn.has_value()) {
    return std::nullopt;
  }

  const auto* bc_field = field_at(fields, schema_.concentration_col);
  const auto bc = (bc_field != nullptr) ? core::csv::parse_number(*bc_field) : std::nullopt;
  if (!bc.has_value() && config_.require_concentration) {
    return std::nullopt;
  }

  if (last_timestamp_.has_value() && ts->utc_seconds < last_timestamp_->utc_seconds) {
    ++stats_.rows_out_of_order;
    return std::nullopt;
  }
  return core::Reading{.timestamp = *ts, .attenuation = *atn, .raw_bc = bc};
}

}  // namespace onabc::ingest
