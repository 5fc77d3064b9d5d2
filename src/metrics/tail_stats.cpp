#include "remote_tail/tail_stats.hpp"
#include <iomanip>
#include <sstream>

namespace rt {

StatsRegistry::StatsRegistry() : started_(std::chrono::steady_clock::now()) {}

TailStats StatsRegistry::snapshot() const {
  TailStats s;
  s.polls = polls_;
  s.failed_polls = failed_polls_;
  s.lines = lines_;
  s.bytes = bytes_;
  s.truncations = truncations_;
  s.checkpoint_failures = checkpoint_failures_;
  s.uptime_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
  return s;
}

std::string StatsRegistry::summary(const TailStats& s) {
  std::ostringstream o;
  o << "polls=" << s.polls
    << " failed=" << s.failed_polls
    << " lines=" << s.lines
    << " bytes=" << s.bytes
    << " truncations=" << s.truncations
    << " checkpoint_failures=" << s.checkpoint_failures
    << " uptime_s=" << std::fixed << std::setprecision(1) << s.uptime_s;
  return o.str();
}

}
