/**
 * @file test_progress_reporter.cpp
 * @brief Progress reporter clamping, monotonicity and callback isolation tests.
 * @author Watosn
 */

#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "onabc/core/progress.hpp"

int main() {
  using onabc::core::ProgressEvent;
  using onabc::core::ProgressReporter;

  {
    std::vector<ProgressEvent> events;
    ProgressReporter reporter([&events](const ProgressEvent& e) { events.push_back(e); });
    reporter.report(10, "ten");
    reporter.report(5, "backwards");
    reporter.report(-20, "negative");
    reporter.note("note");
    reporter.report(150, "overflow");
    if (events.size() != 5U || events[0].percent != 10 || events[1].percent != 10 || events[2].percent != 10 ||
        events[3].percent != 10 || events[3].message != "note" || events[4].percent != 100 || reporter.percent() != 100) {
      spdlog::error("percent not clamped or not monotonic");
      return 1;
    }
    for (const auto& e : events) {
      if (e.terminal) {
        spdlog::error("non-terminal report flagged terminal");
        return 2;
      }
    }
  }

  {
    std::vector<ProgressEvent> events;
    ProgressReporter reporter([&events](const ProgressEvent& e) { events.push_back(e); });
    reporter.report(40, "working");
    reporter.finish("done");
    reporter.finish("done again");
    reporter.fail("late failure");
    reporter.report(50, "after terminal");
    if (events.size() != 2U || !events[1].terminal || events[1].percent != 100 || events[1].message != "done" ||
        !reporter.terminal_sent()) {
      spdlog::error("terminal event not sent exactly once");
      return 3;
    }
  }

  {
    std::vector<ProgressEvent> events;
    ProgressReporter reporter([&events](const ProgressEvent& e) { events.push_back(e); });
    reporter.report(30, "working");
    reporter.fail("Error: broken input");
    if (events.size() != 2U || !events[1].terminal || events[1].percent != 30 ||
        events[1].message != "Error: broken input") {
      spdlog::error("failure event mismatch");
      return 4;
    }
  }

  {
    int calls = 0;
    ProgressReporter reporter([&calls](const ProgressEvent&) {
      ++calls;
      if (calls == 1) {
        throw std::runtime_error("job tracker unavailable");
      }
    });
    reporter.report(10, "first");
    reporter.report(20, "second");
    reporter.finish("done");
    if (calls != 3 || reporter.callback_failures() != 1U || reporter.percent() != 100) {
      spdlog::error("throwing callback disrupted reporting");
      return 5;
    }
  }

  {
    int calls = 0;
    ProgressReporter reporter([&calls](const ProgressEvent&) {
      ++calls;
      if (calls == 2) {
        throw 42;
      }
    });
    reporter.report(10, "first");
    reporter.report(20, "second");
    reporter.fail("Error: late");
    if (calls != 3 || reporter.callback_failures() != 1U || !reporter.terminal_sent() || reporter.percent() != 20) {
      spdlog::error("non-standard exception from callback disrupted reporting");
      return 7;
    }
  }

  {
    ProgressReporter silent;
    silent.report(10, "nobody listening");
    silent.finish("done");
    if (!silent.terminal_sent() || silent.percent() != 100) {
      spdlog::error("reporter without callback mismatch");
      return 6;
    }
  }

  return 0;
}
