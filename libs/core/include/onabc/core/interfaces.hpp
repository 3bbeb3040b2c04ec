/**
 * @file interfaces.hpp
 * @brief Core stage interfaces shared by ingestion and processing.
 * @author Watosn
 */
#pragma once

#include <optional>

#include "onabc/core/types.hpp"

namespace onabc::core {

/**
 * @brief Lazy, finite, single-pass sequence of validated readings.
 */
class IReadingSource {
 public:
  virtual ~IReadingSource() = default;
  /**
   * @brief Pull the next reading.
   * @return Next reading, or nullopt once the input is exhausted.
   */
  [[nodiscard]] virtual std::optional<Reading> next() = 0;
  /**
   * @brief Fraction of the underlying input consumed so far.
   * @return Value in [0, 1], or a negative value if the input size is unknown.
   */
  [[nodiscard]] virtual double fraction_consumed() const { return -1.0; }
};

}  // namespace onabc::core
