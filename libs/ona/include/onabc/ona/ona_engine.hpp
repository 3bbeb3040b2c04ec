/**
 * @file ona_engine.hpp
 * @brief Optimized Noise-reduction Averaging (ONA) adaptive-window engine.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "onabc/core/interfaces.hpp"
#include "onabc/core/progress.hpp"
#include "onabc/core/types.hpp"

namespace onabc::ona {

/**
 * @brief Relative slack applied to the threshold comparison so that
 *        attenuation steps equal to `atn_min` close despite binary rounding.
 *
 * The effective threshold is `atn_min * (1 - kRelativeThresholdSlack)`, which
 * stays positive for every `atn_min` in (0, 1].
 */
constexpr double kRelativeThresholdSlack = 1e-9;

/**
 * @brief Smallest |delta ATN| that closes a window for the given `atn_min`.
 */
[[nodiscard]] constexpr double closing_threshold(const double atn_min) noexcept {
  return atn_min * (1.0 - kRelativeThresholdSlack);
}

/**
 * @brief Pull-based ONA state machine over a reading source.
 *
 * A window opens on the first reading it receives. Each later reading is
 * appended and the window closes once |last ATN - start ATN| >= `atn_min`;
 * the reading after a close seeds the next window. A window still open at the
 * end of input is emitted as a trailing record.
 */
class OnaEngine final {
 public:
  /**
   * @brief Engine configuration.
   */
  struct Config {
    double atn_min{0.01};
    /// Closed windows between progress events; 0 disables them.
    std::size_t progress_every_windows{1000};
  };

  enum class State : unsigned char { Accumulating, Closed };

  /**
   * @brief Check `atn_min` lies in (0, 1].
   */
  [[nodiscard]] static core::Status validate(const Config& config, std::string* message = nullptr);

  OnaEngine(core::IReadingSource& source, Config config, core::ProgressReporter* progress = nullptr);

  /**
   * @brief Produce the next processed record.
   * @return Next record, or nullopt when the input is exhausted or processing failed
   *         (inspect `status()`). Zero readings overall yields `DataQualityError`.
   */
  [[nodiscard]] std::optional<core::ProcessedRecord> next();

  [[nodiscard]] core::Status status() const noexcept { return status_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }
  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] std::size_t readings_consumed() const noexcept { return readings_consumed_; }
  [[nodiscard]] std::size_t records_emitted() const noexcept { return records_emitted_; }
  [[nodiscard]] std::size_t windows_closed() const noexcept { return windows_closed_; }

 private:
  struct Window {
    double start_attenuation{};
    std::size_t size{};
    double bc_sum{};
    std::size_t bc_count{};
    core::Reading last{};
  };

  void open_window(const core::Reading& r);
  void append(const core::Reading& r);
  core::ProcessedRecord close_window(bool trailing);

  core::IReadingSource& source_;
  Config config_{};
  core::ProgressReporter* progress_{nullptr};

  Window window_{};
  State state_{State::Accumulating};
  bool finished_{false};
  core::Status status_{core::Status::Ok};
  std::string message_{};

  std::size_t readings_consumed_{0};
  std::size_t records_emitted_{0};
  std::size_t windows_closed_{0};
};

/**
 * @brief Drained output of one engine run.
 */
struct OnaRun {
  std::vector<core::ProcessedRecord> records{};
  core::Status status{core::Status::Ok};
  std::string message{};
  std::size_t readings{};
};

/**
 * @brief Run the engine to completion and collect every record.
 */
[[nodiscard]] OnaRun run_ona(core::IReadingSource& source, const OnaEngine::Config& config,
                             core::ProgressReporter* progress = nullptr);

}  // namespace onabc::ona
