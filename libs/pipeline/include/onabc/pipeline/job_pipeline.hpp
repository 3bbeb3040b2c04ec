/**
 * @file job_pipeline.hpp
 * @brief One processing job: ingestion, ONA and correlation with progress milestones.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "onabc/core/progress.hpp"
#include "onabc/core/types.hpp"
#include "onabc/correlation/correlation_engine.hpp"
#include "onabc/ingest/aethalometer_csv_source.hpp"
#include "onabc/ona/ona_engine.hpp"
#include "onabc/weather/weather_series.hpp"

namespace onabc::pipeline {

/**
 * @brief Receives each processed record as soon as it is produced.
 */
using RecordSink = std::function<void(const core::ProcessedRecord&)>;

/**
 * @brief Aggregated configuration of one job.
 */
struct JobConfig {
  ingest::AethalometerCsvSource::Config source{};
  ona::OnaEngine::Config ona{};
  correlation::CorrelationEngine::Config correlation{};
  /// Return the record sequence in `JobResult::records`.
  bool retain_records{true};
  /// Compute raw vs processed BC agreement.
  bool compare_raw_processed{true};
};

/**
 * @brief Validate every stage configuration.
 */
[[nodiscard]] core::Status validate(const JobConfig& config, std::string* message = nullptr);

/**
 * @brief Output surface of one job.
 *
 * `correlations` is disengaged when no weather input was supplied or it could
 * not be used; `warnings` then says why.
 */
struct JobResult {
  core::Status status{core::Status::Ok};
  std::string message{};
  std::vector<core::ProcessedRecord> records{};
  std::optional<std::map<weather::Covariate, correlation::CorrelationResult>> correlations{};
  std::optional<correlation::ComparisonResult> comparison{};
  ingest::AethalometerCsvSource::Stats ingest{};
  std::size_t readings{};
  std::size_t records_emitted{};
  std::size_t windows_closed{};
  std::vector<std::string> warnings{};
};

/**
 * @brief Run one job over already-open streams.
 * @param aethalometer Aethalometer CSV input.
 * @param weather_in Optional weather CSV input; null for none.
 * @param config Job configuration.
 * @param progress Progress callback; receives exactly one terminal event.
 * @param sink Optional per-record consumer.
 */
[[nodiscard]] JobResult run_job(std::istream& aethalometer, std::istream* weather_in, const JobConfig& config,
                                core::ProgressCallback progress = {}, const RecordSink& sink = {});

/**
 * @brief Run one job over files.
 */
[[nodiscard]] JobResult run_job_files(const std::filesystem::path& aethalometer_csv,
                                      const std::optional<std::filesystem::path>& weather_csv,
                                      const JobConfig& config, core::ProgressCallback progress = {},
                                      const RecordSink& sink = {});

}  // namespace onabc::pipeline
