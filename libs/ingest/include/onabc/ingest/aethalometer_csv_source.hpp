/**
 * @file aethalometer_csv_source.hpp
 * @brief Chunked, bounded-memory reading source backed by aethalometer CSV exports.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "onabc/core/interfaces.hpp"
#include "onabc/core/progress.hpp"
#include "onabc/ingest/aethalometer_schema.hpp"

namespace onabc::ingest {

/**
 * @brief Reading source over an aethalometer CSV stream.
 *
 * Rows are parsed `chunk_rows` at a time; only the current chunk is held in
 * memory. Rows with an unparsable timestamp, a missing or non-finite
 * attenuation, a missing concentration (unless `require_concentration` is
 * false), or a timestamp earlier than the previous accepted row are dropped
 * and counted.
 */
class AethalometerCsvSource final : public core::IReadingSource {
 public:
  /**
   * @brief Source configuration.
   */
  struct Config {
    core::Channel channel{core::Channel::Blue};
    std::size_t chunk_rows{100000};
    bool require_concentration{true};
  };

  /**
   * @brief Running ingestion counters.
   * @note `rows_out_of_order` is a subset of `rows_skipped`.
   */
  struct Stats {
    std::size_t rows_read{};
    std::size_t rows_accepted{};
    std::size_t rows_skipped{};
    std::size_t rows_out_of_order{};
    std::size_t chunks{};
    std::size_t bytes_consumed{};
    std::size_t total_bytes{};
  };

  /**
   * @brief Outcome of opening a source; `source` is null unless `status` is Ok.
   */
  struct OpenResult {
    std::unique_ptr<AethalometerCsvSource> source{};
    core::Status status{core::Status::Ok};
    std::string message{};
  };

  /**
   * @brief Validate the configuration without touching any input.
   */
  [[nodiscard]] static core::Status validate(const Config& config, std::string* message = nullptr);

  /**
   * @brief Read the header and bind the schema.
   * @param in Input stream; must outlive the returned source.
   * @param config Source configuration.
   * @param progress Optional reporter for per-chunk events; must outlive the source.
   */
  static OpenResult open(std::istream& in, const Config& config, core::ProgressReporter* progress = nullptr);

  /**
   * @brief Open a CSV file; the returned source owns the file stream.
   */
  static OpenResult open_file(const std::filesystem::path& path, const Config& config,
                              core::ProgressReporter* progress = nullptr);

  [[nodiscard]] std::optional<core::Reading> next() override;
  [[nodiscard]] double fraction_consumed() const override;

  [[nodiscard]] const AethalometerSchema& schema() const noexcept { return schema_; }
  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  AethalometerCsvSource(std::istream& in, Config config, AethalometerSchema schema, core::ProgressReporter* progress)
      : in_(in), config_(config), schema_(std::move(schema)), progress_(progress) {}

  bool fill_chunk();
  std::optional<core::Reading> parse_row(const std::string& line);

  std::unique_ptr<std::istream> owned_{};
  std::istream& in_;
  Config config_{};
  AethalometerSchema schema_{};
  core::ProgressReporter* progress_{nullptr};

  std::vector<core::Reading> chunk_{};
  std::size_t chunk_pos_{0};
  bool eof_{false};
  std::optional<core::Timestamp> last_timestamp_{};
  Stats stats_{};
};

}  // namespace onabc::ingest
