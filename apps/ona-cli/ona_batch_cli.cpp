/**
 * @file ona_batch_cli.cpp
 * @brief Batch ONA runner with CSV/JSON outputs and optional weather correlation.
 * @author Watosn
 */

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "onabc/core/json_utils.hpp"
#include "onabc/core/time_utils.hpp"
#include "onabc/pipeline/job_pipeline.hpp"

namespace {

std::string opt_csv(const std::optional<double>& v) { return v.has_value() ? fmt::format("{}", *v) : std::string{}; }

std::string opt_json(const std::optional<double>& v) { return v.has_value() ? fmt::format("{}", *v) : "null"; }

bool parse_double(const char* text, double& out) {
  char* end = nullptr;
  const double v = std::strtod(text, &end);
  if (end == text || *end != '\0') {
    return false;
  }
  out = v;
  return true;
}

std::optional<std::size_t> chunk_rows_from_env() {
  const char* env = std::getenv("ONABC_CHUNK_ROWS");
  if (env == nullptr || *env == '\0') {
    return std::nullopt;
  }
  char* end = nullptr;
  const unsigned long long v = std::strtoull(env, &end, 10);
  if (end == env || *end != '\0' || v == 0ULL) {
    spdlog::warn("ignoring invalid ONABC_CHUNK_ROWS={}", env);
    return std::nullopt;
  }
  return static_cast<std::size_t>(v);
}

std::string correlation_json(const std::string& name, const onabc::correlation::CorrelationResult& c) {
  return fmt::format(
      "{{\"record_type\":\"correlation\",\"schema\":\"ona_batch_v1\",\"covariate\":\"{}\",\"status\":\"{}\","
      "\"pairs\":{},\"pearson_r\":{},\"pearson_p\":{},\"spearman_r\":{},\"spearman_p\":{}}}",
      name, onabc::core::status_to_string(c.status), c.pairs, opt_json(c.pearson_r), opt_json(c.pearson_p),
      opt_json(c.spearman_r), opt_json(c.spearman_p));
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4 || argc > 8) {
    spdlog::error(
        "usage: ona_batch_cli <aethalometer_csv> <output_file> <format:csv|json> [channel] [atn_min] [weather_csv] "
        "[tolerance_s]");
    spdlog::error("channels: UV, Blue, Green, Red, IR");
    return 1;
  }

  const std::filesystem::path input_path = argv[1];
  const std::filesystem::path output_path = argv[2];
  const std::string format = argv[3];
  const std::string channel_name = (argc >= 5) ? argv[4] : "Blue";
  const std::string weather_csv = (argc >= 7) ? argv[6] : "";
  if (format != "csv" && format != "json") {
    spdlog::error("format must be csv or json");
    return 4;
  }

  onabc::pipeline::JobConfig config{};
  const auto channel = onabc::core::parse_channel(channel_name);
  if (!channel.has_value()) {
    spdlog::error("unknown channel: {}", channel_name);
    return 4;
  }
  config.source.channel = *channel;
  if (argc >= 6 && !parse_double(argv[5], config.ona.atn_min)) {
    spdlog::error("atn_min must be a number, got {}", argv[5]);
    return 4;
  }
  if (argc >= 8 && !parse_double(argv[7], config.correlation.tolerance_s)) {
    spdlog::error("tolerance_s must be a number, got {}", argv[7]);
    return 4;
  }
  if (const auto rows = chunk_rows_from_env()) {
    config.source.chunk_rows = *rows;
  }
  config.retain_records = false;

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }

  const std::time_t now = std::time(nullptr);
  const char* channel_str = onabc::core::channel_to_string(config.source.channel);
  if (format == "csv") {
    out << fmt::format(
        "#record_type=metadata,schema=ona_batch_v1,project=onabc,generated_unix_utc={},channel={},atn_min={},"
        "weather_csv={},tolerance_s={}\n",
        now, channel_str, config.ona.atn_min, weather_csv, config.correlation.tolerance_s);
    out << "timestamp_utc_s,timestamp_iso,raw_bc,processed_bc,atn,window_size,trailing\n";
  } else {
    out << fmt::format(
        "{{\"record_type\":\"metadata\",\"schema\":\"ona_batch_v1\",\"project\":\"onabc\",\"generated_unix_utc\":{},"
        "\"channel\":\"{}\",\"atn_min\":{},\"weather_csv\":\"{}\",\"tolerance_s\":{}}}\n",
        now, channel_str, config.ona.atn_min, onabc::core::json::escape(weather_csv), config.correlation.tolerance_s);
  }

  const auto sink = [&](const onabc::core::ProcessedRecord& r) {
    const std::string iso = onabc::core::time::format_iso8601(r.timestamp);
    if (format == "json") {
      out << fmt::format(
          "{{\"record_type\":\"sample\",\"schema\":\"ona_batch_v1\",\"timestamp_utc_s\":{},\"timestamp_iso\":\"{}\","
          "\"raw_bc\":{},\"processed_bc\":{},\"atn\":{},\"window_size\":{},\"trailing\":{}}}\n",
          r.timestamp.utc_seconds, iso, opt_json(r.raw_bc), opt_json(r.processed_bc), opt_json(r.attenuation),
          r.window_size, r.trailing ? "true" : "false");
    } else {
      out << fmt::format("{},{},{},{},{},{},{}\n", r.timestamp.utc_seconds, iso, opt_csv(r.raw_bc),
                         opt_csv(r.processed_bc), opt_csv(r.attenuation), r.window_size, r.trailing ? 1 : 0);
    }
  };

  const auto progress = [](const onabc::core::ProgressEvent& e) {
    if (e.terminal) {
      spdlog::info("[{:3d}%] {}", e.percent, e.message);
    } else {
      spdlog::debug("[{:3d}%] {}", e.percent, e.message);
    }
  };

  std::optional<std::filesystem::path> weather_path{};
  if (!weather_csv.empty()) {
    weather_path = weather_csv;
  }
  const auto result = onabc::pipeline::run_job_files(input_path, weather_path, config, progress, sink);
  if (result.status != onabc::core::Status::Ok) {
    spdlog::error("{}: {}", onabc::core::status_to_string(result.status), result.message);
    return result.status == onabc::core::Status::IoError ? 2 : 5;
  }

  if (result.correlations.has_value()) {
    for (const auto& [covariate, stats] : *result.correlations) {
      const std::string name = onabc::weather::covariate_to_string(covariate);
      if (format == "json") {
        out << correlation_json(name, stats) << "\n";
      }
      if (stats.status == onabc::core::Status::Ok) {
        spdlog::info("{}: pearson r={:.4f} p={:.4g}, spearman r={:.4f} p={:.4g} ({} pairs)", name, *stats.pearson_r,
                     *stats.pearson_p, *stats.spearman_r, *stats.spearman_p, stats.pairs);
      } else {
        spdlog::warn("{}: {} ({})", name, onabc::core::status_to_string(stats.status), stats.message);
      }
    }
  }
  if (result.comparison.has_value() && result.comparison->stats.status == onabc::core::Status::Ok) {
    spdlog::info("raw vs processed: pearson r={:.4f} over {} points ({:.1f}% null)",
                 *result.comparison->stats.pearson_r, result.comparison->data_points,
                 result.comparison->null_percentage);
  }
  if (format == "json") {
    out << fmt::format(
        "{{\"record_type\":\"summary\",\"schema\":\"ona_batch_v1\",\"rows_read\":{},\"rows_skipped\":{},"
        "\"rows_out_of_order\":{},\"readings\":{},\"records\":{},\"windows_closed\":{}}}\n",
        result.ingest.rows_read, result.ingest.rows_skipped, result.ingest.rows_out_of_order, result.readings,
        result.records_emitted, result.windows_closed);
  }
  return 0;
}
