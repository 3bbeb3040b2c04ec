/**
 * @file progress.hpp
 * @brief Progress callback contract and monotonic reporter.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <exception>
#include <functional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "onabc/core/types.hpp"

namespace onabc::core {

/**
 * @brief Single-parameter progress callback owned by the job-tracking collaborator.
 */
using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief Synchronous, non-blocking progress publisher.
 *
 * Percent values are clamped to [0, 100] and never move backwards. A failing
 * callback is logged and otherwise ignored; the terminal event is sent once.
 */
class ProgressReporter final {
 public:
  ProgressReporter() = default;
  explicit ProgressReporter(ProgressCallback callback) : callback_(std::move(callback)) {}

  void report(const int percent, std::string message) {
    if (terminal_sent_) {
      return;
    }
    percent_ = std::max(percent_, std::clamp(percent, 0, 100));
    publish(ProgressEvent{.percent = percent_, .message = std::move(message), .terminal = false});
  }

  /**
   * @brief Re-publish the current percent with a new message.
   */
  void note(std::string message) { report(percent_, std::move(message)); }

  void finish(std::string message) {
    if (terminal_sent_) {
      return;
    }
    percent_ = 100;
    terminal_sent_ = true;
    publish(ProgressEvent{.percent = 100, .message = std::move(message), .terminal = true});
  }

  /**
   * @brief Terminal failure event; percent stays where processing stopped.
   */
  void fail(std::string message) {
    if (terminal_sent_) {
      return;
    }
    terminal_sent_ = true;
    publish(ProgressEvent{.percent = percent_, .message = std::move(message), .terminal = true});
  }

  [[nodiscard]] int percent() const noexcept { return percent_; }
  [[nodiscard]] bool terminal_sent() const noexcept { return terminal_sent_; }
  [[nodiscard]] std::size_t callback_failures() const noexcept { return callback_failures_; }

 private:
  void publish(const ProgressEvent& event) {
    if (!callback_) {
      return;
    }
    try {
      callback_(event);
    } catch (const std::exception& e) {
      ++callback_failures_;
      spdlog::warn("progress callback failed at {}%: {}", event.percent, e.what());
    } catch (...) {
      ++callback_failures_;
      spdlog::warn("progress callback failed at {}%: non-standard exception", event.percent);
    }
  }

  ProgressCallback callback_{};
  int percent_{0};
  bool terminal_sent_{false};
  std::size_t callback_failures_{0};
};

}  // namespace onabc::core
