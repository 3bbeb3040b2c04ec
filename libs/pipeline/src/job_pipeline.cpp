/**
 * @file job_pipeline.cpp
 * @brief Job pipeline implementation.
 * @author Watosn
 */

#include "onabc/pipeline/job_pipeline.hpp"

#include <fstream>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace onabc::pipeline {
namespace {

JobResult fail_job(JobResult out, core::ProgressReporter& reporter, const core::Status status, std::string message) {
  out.status = status;
  out.message = std::move(message);
  out.records.clear();
  spdlog::error("job failed ({}): {}", core::status_to_string(status), out.message);
  reporter.fail(fmt::format("Error: {}", out.message));
  return out;
}

}  // namespace

core::Status validate(const JobConfig& config, std::string* message) {
  core::Status s = ingest::AethalometerCsvSource::validate(config.source, message);
  if (s != core::Status::Ok) {
    return s;
  }
  s = ona::OnaEngine::validate(config.ona, message);
  if (s != core::Status::Ok) {
    return s;
  }
  return correlation::CorrelationEngine::validate(config.correlation, message);
}

JobResult run_job(std::istream& aethalometer, std::istream* weather_in, const JobConfig& config,
                  core::ProgressCallback progress, const RecordSink& sink) {
  JobResult out{};
  core::ProgressReporter reporter(std::move(progress));
  reporter.report(0, "Starting data processing...");
  spdlog::info("job start: channel={} atn_min={} chunk_rows={} weather={}",
               core::channel_to_string(config.source.channel), config.ona.atn_min, config.source.chunk_rows,
               weather_in != nullptr ? "yes" : "no");

  std::string message;
  if (const core::Status s = validate(config, &message); s != core::Status::Ok) {
    return fail_job(std::move(out), reporter, s, message);
  }

  reporter.report(5, "Reading CSV file in chunks...");
  auto opened = ingest::AethalometerCsvSource::open(aethalometer, config.source, &reporter);
  if (opened.status != core::Status::Ok) {
    return fail_job(std::move(out), reporter, opened.status, opened.message);
  }
  auto& source = *opened.source;
  reporter.note(fmt::format("Using columns: {} and {}", source.schema().attenuation_name,
                            source.schema().concentration_name));

  // Correlation and comparison need the full record set.
  const bool keep = config.retain_records || weather_in != nullptr || config.compare_raw_processed;
  ona::OnaEngine engine(source, config.ona, &reporter);
  while (auto rec = engine.next()) {
    if (sink) {
      sink(*rec);
    }
    if (keep) {
      out.records.push_back(*rec);
    }
  }
  out.ingest = source.stats();
  out.readings = engine.readings_consumed();
  out.records_emitted = engine.records_emitted();
  out.windows_closed = engine.windows_closed();
  if (engine.status() != core::Status::Ok) {
    return fail_job(std::move(out), reporter, engine.status(),
                    fmt::format("{} for channel {} ({} rows read, {} skipped)", engine.message(),
                                core::channel_to_string(config.source.channel), out.ingest.rows_read,
                                out.ingest.rows_skipped));
  }
  reporter.report(85, "ONA algorithm applied successfully");

  const correlation::CorrelationEngine correlator(config.correlation);
  if (config.compare_raw_processed) {
    out.comparison = correlator.compare_raw_processed(out.records);
  }

  if (weather_in != nullptr) {
    reporter.note("Processing weather data...");
    auto loaded = weather::WeatherSeries::load(*weather_in);
    if (loaded.status != core::Status::Ok) {
      const std::string warning = fmt::format("Warning: Error processing weather data: {}", loaded.message);
      spdlog::warn("{}", warning);
      out.warnings.push_back(warning);
    } else {
      if (loaded.rows_skipped > 0U) {
        spdlog::warn("weather input: skipped {} rows with unparsable timestamps", loaded.rows_skipped);
      }
      if (loaded.series.covariates().empty()) {
        const std::string warning = "Warning: No recognized weather covariates found";
        spdlog::warn("{}", warning);
        out.warnings.push_back(warning);
      }
      reporter.report(90, "Synchronizing and correlating weather data...");
      out.correlations = correlator.correlate(out.records, loaded.series);
    }
  }

  if (!config.retain_records) {
    out.records.clear();
    out.records.shrink_to_fit();
  }

  if (out.ingest.rows_skipped > 0U) {
    spdlog::warn("skipped {} of {} rows ({} out of order)", out.ingest.rows_skipped, out.ingest.rows_read,
                 out.ingest.rows_out_of_order);
  }
  if (reporter.callback_failures() > 0U) {
    spdlog::warn("progress callback failed {} times", reporter.callback_failures());
  }
  out.message = fmt::format("Processing completed successfully: {} records from {} readings ({} rows skipped)",
                            out.records_emitted, out.readings, out.ingest.rows_skipped);
  spdlog::info("{}", out.message);
  reporter.finish(out.message);
  return out;
}

JobResult run_job_files(const std::filesystem::path& aethalometer_csv,
                        const std::optional<std::filesystem::path>& weather_csv, const JobConfig& config,
                        core::ProgressCallback progress, const RecordSink& sink) {
  std::ifstream aeth(aethalometer_csv, std::ios::binary);
  if (!aeth) {
    JobResult out{};
    core::ProgressReporter reporter(std::move(progress));
    return fail_job(std::move(out), reporter, core::Status::IoError,
                    fmt::format("failed to open aethalometer csv: {}", aethalometer_csv.string()));
  }

  std::ifstream wx;
  std::istream* weather_in = nullptr;
  if (weather_csv.has_value()) {
    wx.open(*weather_csv, std::ios::binary);
    // An unreadable weather file degrades inside run_job like any other weather failure.
    weather_in = &wx;
  }
  return run_job(aeth, weather_in, config, std::move(progress), sink);
}

}  // namespace onabc::pipeline
