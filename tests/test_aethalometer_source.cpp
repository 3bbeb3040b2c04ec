/**
 * @file test_aethalometer_source.cpp
 * @brief Aethalometer CSV schema binding and chunked ingestion tests.
 * @author Watosn
 */

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "onabc/core/progress.hpp"
#include "onabc/ingest/aethalometer_csv_source.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

const char* kPairedCsv =
    "Date local (yyyy/MM/dd),Time local (hh:mm:ss),Blue ATN1,Blue BC1,IR ATN1,IR BC1\n"
    "2024/01/15,10:00:00,1.000,1200,2.0,900\n"
    "2024/01/15,10:01:00,1.004,,2.1,910\n"
    "2024/01/15,10:02:00,NaN,1300,2.2,920\n"
    "2024/01/15,bad,1.010,1250,2.3,930\n"
    "2024/01/15,09:59:00,1.020,1400,2.4,940\n"
    "2024/01/15,10:03:00,1.012,1350,2.5,950\n"
    "\n"
    "2024/01/15,10:04:00,1.020,1500,2.6,960\n";

std::vector<onabc::core::Reading> drain(onabc::ingest::AethalometerCsvSource& src) {
  std::vector<onabc::core::Reading> out;
  while (auto r = src.next()) {
    out.push_back(*r);
  }
  return out;
}

}  // namespace

int main() {
  using onabc::core::Channel;
  using onabc::core::Status;
  using onabc::ingest::AethalometerCsvSource;

  {
    std::istringstream in(kPairedCsv);
    onabc::core::ProgressReporter reporter;
    auto opened = AethalometerCsvSource::open(in, {.channel = Channel::Blue, .chunk_rows = 2}, &reporter);
    if (opened.status != Status::Ok || !opened.source) {
      spdlog::error("open failed: {}", opened.message);
      return 1;
    }
    const auto& schema = opened.source->schema();
    if (schema.timestamp_col.has_value() || schema.date_col != 0U || schema.time_col != 1U ||
        schema.attenuation_col != 2U || schema.concentration_col != 3U || schema.attenuation_name != "Blue ATN1" ||
        schema.concentration_name != "Blue BC1") {
      spdlog::error("unexpected schema binding");
      return 2;
    }

    const auto readings = drain(*opened.source);
    const auto& st = opened.source->stats();
    if (readings.size() != 3U || st.rows_read != 7U || st.rows_accepted != 3U || st.rows_skipped != 4U ||
        st.rows_out_of_order != 1U || st.chunks != 4U) {
      spdlog::error("unexpected ingest counts: readings={} read={} skipped={} ooo={} chunks={}", readings.size(),
                    st.rows_read, st.rows_skipped, st.rows_out_of_order, st.chunks);
      return 3;
    }
    // 2024-01-15T10:00:00Z
    if (!approx(readings[0].timestamp.utc_seconds, 1705312800.0, 0.0) || !approx(readings[0].attenuation, 1.0, 1e-12) ||
        !readings[0].raw_bc.has_value() || !approx(*readings[0].raw_bc, 1200.0, 1e-12) ||
        !approx(readings[2].timestamp.utc_seconds, 1705313040.0, 0.0)) {
      spdlog::error("unexpected reading values");
      return 4;
    }
    for (std::size_t i = 1; i < readings.size(); ++i) {
      if (readings[i].timestamp < readings[i - 1].timestamp) {
        spdlog::error("readings out of order");
        return 5;
      }
    }
    if (!approx(opened.source->fraction_consumed(), 1.0, 1e-12) || reporter.percent() < 5 || reporter.percent() > 85) {
      spdlog::error("unexpected ingestion progress: fraction={} percent={}", opened.source->fraction_consumed(),
                    reporter.percent());
      return 6;
    }
  }

  {
    std::istringstream in(kPairedCsv);
    auto opened = AethalometerCsvSource::open(in, {.channel = Channel::Blue, .require_concentration = false});
    if (opened.status != Status::Ok) {
      spdlog::error("open without concentration requirement failed");
      return 7;
    }
    const auto readings = drain(*opened.source);
    if (readings.size() != 4U || readings[1].raw_bc.has_value() || opened.source->stats().rows_skipped != 3U) {
      spdlog::error("missing concentration handling mismatch");
      return 8;
    }
  }

  {
    std::istringstream in(kPairedCsv);
    const auto opened = AethalometerCsvSource::open(in, {.channel = Channel::Green});
    if (opened.status != Status::ConfigurationError || opened.source ||
        opened.message != "Could not find Green ATN and BC columns") {
      spdlog::error("missing channel not reported: {}", opened.message);
      return 9;
    }
  }

  {
    std::istringstream in("Station,Blue ATN1,Blue BC1\nA,1.0,100\n");
    const auto opened = AethalometerCsvSource::open(in, {});
    if (opened.status != Status::ConfigurationError) {
      spdlog::error("missing timestamp column not reported");
      return 10;
    }
  }

  {
    std::istringstream in(kPairedCsv);
    const auto opened = AethalometerCsvSource::open(in, {.chunk_rows = 0});
    if (opened.status != Status::ConfigurationError) {
      spdlog::error("chunk_rows=0 accepted");
      return 11;
    }
  }

  {
    // Combined timestamp column, CRLF line endings and a decorated concentration header.
    std::istringstream in(
        "Timestamp,UV ATN1,UV BC1 Corrected,Blue ATN1,Blue BC1\r\n"
        "2024-01-15 10:00:00,3.0,800,1.0,100\r\n"
        "2024-01-15 10:01:00,3.1,810,1.1,110\r\n");
    auto opened = AethalometerCsvSource::open(in, {.channel = Channel::UV});
    if (opened.status != Status::Ok || opened.source->schema().timestamp_col != 0U ||
        opened.source->schema().concentration_col != 2U) {
      spdlog::error("combined timestamp schema failed: {}", opened.message);
      return 12;
    }
    const auto readings = drain(*opened.source);
    if (readings.size() != 2U || !approx(readings[1].attenuation, 3.1, 1e-12) || !approx(*readings[1].raw_bc, 810.0, 1e-12)) {
      spdlog::error("combined timestamp rows mismatch");
      return 13;
    }
  }

  {
    std::istringstream in("");
    const auto opened = AethalometerCsvSource::open(in, {});
    if (opened.status != Status::ConfigurationError) {
      spdlog::error("empty input accepted");
      return 14;
    }
  }

  {
    const auto opened = AethalometerCsvSource::open_file("/nonexistent/onabc/aethalometer.csv", {});
    if (opened.status != Status::IoError || opened.source) {
      spdlog::error("missing file not reported as io error");
      return 15;
    }
  }

  return 0;
}
