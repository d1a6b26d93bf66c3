#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include "core/logger.hpp"

#include <chrono>
#include <string>
#include <utility>

// Logs the lifetime of the enclosing scope at INFO on `component`
class ScopedTimer {
public:
  ScopedTimer(std::string label, LogComponent component)
      : label_(std::move(label)), component_(component),
        start_time_(std::chrono::steady_clock::now()) {}

  ~ScopedTimer() {
    LOG(LogLevel::INFO, component_,
        label_ << " took " << elapsed_ms() << " ms");
  }

  long long elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start_time_)
        .count();
  }

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

private:
  std::string label_;
  LogComponent component_;
  std::chrono::time_point<std::chrono::steady_clock> start_time_;
};

#endif // SCOPED_TIMER_HPP
