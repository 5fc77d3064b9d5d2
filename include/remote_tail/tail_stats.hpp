#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace rt {

struct TailStats {
  std::uint64_t polls = 0;
  std::uint64_t failed_polls = 0;
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;        // bytes counted into the offset
  std::uint64_t truncations = 0;
  std::uint64_t checkpoint_failures = 0;
  double uptime_s = 0.0;
};

class StatsRegistry {
public:
  StatsRegistry();
  void add_poll() noexcept { ++polls_; }
  void add_failure() noexcept { ++failed_polls_; }
  void add_lines(std::uint64_t n, std::uint64_t bytes) noexcept { lines_ += n; bytes_ += bytes; }
  void add_truncation() noexcept { ++truncations_; }
  void add_checkpoint_failure() noexcept { ++checkpoint_failures_; }

  TailStats snapshot() const;

  // One-line human summary for stderr.
  static std::string summary(const TailStats& s);

private:
  std::uint64_t polls_{0};
  std::uint64_t failed_polls_{0};
  std::uint64_t lines_{0};
  std::uint64_t bytes_{0};
  std::uint64_t truncations_{0};
  std::uint64_t checkpoint_failures_{0};
  std::chrono::steady_clock::time_point started_;
};

}
