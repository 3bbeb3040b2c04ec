/**
 * @file test_job_pipeline.cpp
 * @brief Job pipeline milestones, failure reporting and weather degradation tests.
 * @author Watosn
 */

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "onabc/pipeline/job_pipeline.hpp"

namespace {

using onabc::core::ProgressEvent;

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

const char* kAethalometer =
    "Timestamp,Blue ATN1,Blue BC1\n"
    "2024-01-15 10:00:00,0.000,100\n"
    "2024-01-15 10:01:00,0.005,110\n"
    "2024-01-15 10:02:00,0.012,120\n"
    "2024-01-15 10:03:00,0.020,130\n"
    "2024-01-15 10:04:00,0.030,140\n";

const char* kWeather =
    "timestamp,temperature\n"
    "2024-01-15 10:00:00,1\n"
    "2024-01-15 10:01:00,2\n"
    "2024-01-15 10:02:00,3\n"
    "2024-01-15 10:03:00,4\n"
    "2024-01-15 10:04:00,5\n";

struct Capture {
  std::vector<ProgressEvent> events;
  onabc::core::ProgressCallback callback() {
    return [this](const ProgressEvent& e) { events.push_back(e); };
  }
  int terminal_count() const {
    int n = 0;
    for (const auto& e : events) {
      n += e.terminal ? 1 : 0;
    }
    return n;
  }
  bool monotonic() const {
    for (std::size_t i = 1; i < events.size(); ++i) {
      if (events[i].percent < events[i - 1].percent) {
        return false;
      }
    }
    return true;
  }
  bool saw_percent(const int p) const {
    for (const auto& e : events) {
      if (e.percent == p) {
        return true;
      }
    }
    return false;
  }
};

}  // namespace

int main() {
  using onabc::core::Status;
  using onabc::pipeline::JobConfig;
  using onabc::pipeline::run_job;

  {
    std::istringstream aeth(kAethalometer);
    Capture cap;
    const auto result = run_job(aeth, nullptr, JobConfig{}, cap.callback());
    if (result.status != Status::Ok || result.records.size() != 2U || result.readings != 5U ||
        result.records_emitted != 2U || result.windows_closed != 2U || result.correlations.has_value()) {
      spdlog::error("basic job mismatch: {}", result.message);
      return 1;
    }
    if (!approx(*result.records[0].processed_bc, 110.0, 1e-9) || !approx(*result.records[1].processed_bc, 135.0, 1e-9)) {
      spdlog::error("basic job records mismatch");
      return 2;
    }
    if (cap.events.empty() || cap.events.front().percent != 0 ||
        cap.events.front().message.rfind("Starting data processing", 0) != 0 || cap.terminal_count() != 1 ||
        !cap.events.back().terminal || cap.events.back().percent != 100 || !cap.monotonic() || !cap.saw_percent(85)) {
      spdlog::error("progress milestones mismatch");
      return 3;
    }
    if (cap.events.back().message.find("2 records") == std::string::npos ||
        cap.events.back().message.find("0 rows skipped") == std::string::npos) {
      spdlog::error("final progress message mismatch: {}", cap.events.back().message);
      return 4;
    }
    if (!result.comparison.has_value() || result.comparison->data_points != 2U) {
      spdlog::error("raw vs processed comparison missing");
      return 5;
    }
  }

  {
    std::istringstream aeth(kAethalometer);
    std::istringstream wx(kWeather);
    Capture cap;
    const auto result = run_job(aeth, &wx, JobConfig{}, cap.callback());
    if (result.status != Status::Ok || !result.correlations.has_value() || result.correlations->size() != 1U ||
        !cap.saw_percent(90) || cap.terminal_count() != 1) {
      spdlog::error("job with weather mismatch: {}", result.message);
      return 6;
    }
    const auto& temp = result.correlations->at(onabc::weather::Covariate::Temperature);
    if (temp.status != Status::Ok || temp.pairs != 2U || !approx(*temp.pearson_r, 1.0, 1e-12)) {
      spdlog::error("weather correlation mismatch");
      return 7;
    }
  }

  {
    // Unusable weather degrades to no correlations; the job still succeeds.
    std::istringstream aeth(kAethalometer);
    std::istringstream wx("station,value\nA,1\n");
    Capture cap;
    const auto result = run_job(aeth, &wx, JobConfig{}, cap.callback());
    if (result.status != Status::Ok || result.correlations.has_value() || result.warnings.size() != 1U ||
        cap.terminal_count() != 1 || cap.events.back().percent != 100) {
      spdlog::error("weather degradation mismatch");
      return 8;
    }
  }

  {
    std::istringstream aeth(kAethalometer);
    Capture cap;
    JobConfig cfg{};
    cfg.source.channel = onabc::core::Channel::Red;
    const auto result = run_job(aeth, nullptr, cfg, cap.callback());
    if (result.status != Status::ConfigurationError || !result.records.empty() || cap.terminal_count() != 1 ||
        cap.events.back().message.find("Could not find Red ATN and BC columns") == std::string::npos) {
      spdlog::error("missing channel failure mismatch: {}", result.message);
      return 9;
    }
  }

  {
    std::istringstream aeth(
        "Timestamp,Blue ATN1,Blue BC1\n"
        "2024-01-15 10:00:00,0.000,\n"
        "2024-01-15 10:01:00,0.005,\n");
    Capture cap;
    const auto result = run_job(aeth, nullptr, JobConfig{}, cap.callback());
    if (result.status != Status::DataQualityError || result.ingest.rows_skipped != 2U || cap.terminal_count() != 1 ||
        cap.events.back().percent == 100) {
      spdlog::error("no valid readings not reported as data quality error");
      return 10;
    }
  }

  {
    std::istringstream aeth(kAethalometer);
    Capture cap;
    JobConfig cfg{};
    cfg.ona.atn_min = 0.0;
    const auto result = run_job(aeth, nullptr, cfg, cap.callback());
    if (result.status != Status::ConfigurationError || cap.terminal_count() != 1) {
      spdlog::error("invalid atn_min not rejected");
      return 11;
    }
  }

  {
    // Streaming sink without retention.
    std::istringstream aeth(kAethalometer);
    std::size_t streamed = 0;
    JobConfig cfg{};
    cfg.retain_records = false;
    cfg.compare_raw_processed = false;
    const auto result =
        run_job(aeth, nullptr, cfg, {}, [&streamed](const onabc::core::ProcessedRecord&) { ++streamed; });
    if (result.status != Status::Ok || streamed != 2U || !result.records.empty() || result.records_emitted != 2U ||
        result.comparison.has_value()) {
      spdlog::error("record sink mismatch");
      return 12;
    }
  }

  {
    // A throwing progress callback never fails the job.
    std::istringstream aeth(kAethalometer);
    const auto result = run_job(aeth, nullptr, JobConfig{}, [](const ProgressEvent&) {
      throw std::runtime_error("tracker down");
    });
    if (result.status != Status::Ok || result.records.size() != 2U) {
      spdlog::error("throwing progress callback failed the job");
      return 13;
    }
  }

  {
    // Non-standard exceptions from the callback are contained as well.
    std::istringstream aeth(kAethalometer);
    int calls = 0;
    bool terminal = false;
    const auto result = run_job(aeth, nullptr, JobConfig{}, [&](const ProgressEvent& e) {
      ++calls;
      terminal = terminal || e.terminal;
      if (calls == 2) {
        throw 42;
      }
    });
    if (result.status != Status::Ok || result.records.size() != 2U || !terminal) {
      spdlog::error("non-standard callback exception aborted the job after {} calls", calls);
      return 16;
    }
  }

  {
    Capture cap;
    const auto result =
        onabc::pipeline::run_job_files("/nonexistent/onabc/aethalometer.csv", std::nullopt, JobConfig{}, cap.callback());
    if (result.status != Status::IoError || cap.terminal_count() != 1) {
      spdlog::error("missing input file not reported as io error");
      return 14;
    }
  }

  {
    std::string message;
    JobConfig cfg{};
    cfg.source.chunk_rows = 0;
    if (onabc::pipeline::validate(cfg, &message) != Status::ConfigurationError || message.empty() ||
        onabc::pipeline::validate(JobConfig{}) != Status::Ok) {
      spdlog::error("job config validation mismatch");
      return 15;
    }
  }

  return 0;
}
