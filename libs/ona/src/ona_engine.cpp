/**
 * @file ona_engine.cpp
 * @brief ONA adaptive-window engine implementation.
 * @author Watosn
 */

#include "onabc/ona/ona_engine.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

namespace onabc::ona {
namespace {

constexpr int kProgressStart = 5;
constexpr int kProgressSpan = 80;

}  // namespace

core::Status OnaEngine::validate(const Config& config, std::string* message) {
  if (!std::isfinite(config.atn_min) || config.atn_min <= 0.0 || config.atn_min > 1.0) {
    if (message != nullptr) {
      *message = fmt::format("atn_min must lie in (0, 1], got {}", config.atn_min);
    }
    return core::Status::ConfigurationError;
  }
  return core::Status::Ok;
}

OnaEngine::OnaEngine(core::IReadingSource& source, Config config, core::ProgressReporter* progress)
    : source_(source), config_(config), progress_(progress) {
  status_ = validate(config_, &message_);
  if (status_ != core::Status::Ok) {
    finished_ = true;
  }
}

std::optional<core::ProcessedRecord> OnaEngine::next() {
  if (finished_) {
    return std::nullopt;
  }

  while (true) {
    const auto reading = source_.next();
    if (!reading.has_value()) {
      finished_ = true;
      if (window_.size > 0U) {
        return close_window(true);
      }
      if (records_emitted_ == 0U) {
        status_ = core::Status::DataQualityError;
        message_ = "no valid readings remain for the selected channel";
      }
      return std::nullopt;
    }
    ++readings_consumed_;

    if (window_.size == 0U) {
      open_window(*reading);
      continue;
    }
    append(*reading);
    const double delta = std::abs(window_.last.attenuation - window_.start_attenuation);
    if (delta >= closing_threshold(config_.atn_min)) {
      return close_window(false);
    }
  }
}

void OnaEngine::open_window(const core::Reading& r) {
  window_ = Window{};
  window_.start_attenuation = r.attenuation;
  state_ = State::Accumulating;
  append(r);
}

void OnaEngine::append(const core::Reading& r) {
  ++window_.size;
  if (r.raw_bc.has_value()) {
    window_.bc_sum += *r.raw_bc;
    ++window_.bc_count;
  }
  window_.last = r;
}

core::ProcessedRecord OnaEngine::close_window(const bool trailing) {
  core::ProcessedRecord rec{};
  rec.timestamp = window_.last.timestamp;
  rec.raw_bc = window_.last.raw_bc;
  if (window_.bc_count > 0U) {
    rec.processed_bc = window_.bc_sum / static_cast<double>(window_.bc_count);
  }
  rec.attenuation = window_.last.attenuation;
  rec.window_size = window_.size;
  rec.trailing = trailing;

  window_ = Window{};
  state_ = State::Closed;
  ++records_emitted_;
  if (!trailing) {
    ++windows_closed_;
  }

  if (progress_ != nullptr && !trailing && config_.progress_every_windows > 0U &&
      windows_closed_ % config_.progress_every_windows == 0U) {
    const std::string msg = fmt::format("Applying ONA algorithm: {} windows closed", windows_closed_);
    const double frac = source_.fraction_consumed();
    if (frac >= 0.0) {
      progress_->report(kProgressStart + static_cast<int>(frac * kProgressSpan), msg);
    } else {
      progress_->note(msg);
    }
  }
  return rec;
}

OnaRun run_ona(core::IReadingSource& source, const OnaEngine::Config& config, core::ProgressReporter* progress) {
  OnaRun out{};
  OnaEngine engine(source, config, progress);
  while (auto rec = engine.next()) {
    out.records.push_back(std::move(*rec));
  }
  out.status = engine.status();
  out.message = engine.message();
  out.readings = engine.readings_consumed();
  return out;
}

}  // namespace onabc::ona
