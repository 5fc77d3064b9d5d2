#pragma once
#include "remote_tail/errors.hpp"
#include "remote_tail/fetch_result.hpp"
#include "remote_tail/remote_reader.hpp"
#include "remote_tail/tail_stats.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rt {

struct PollResult {
  bool ok = true;               // false when the fetch failed
  bool truncated = false;
  std::size_t lines = 0;
  bool checkpoint_saved = true; // false when persisting the offset failed
};

// Drives fetch -> extract -> emit -> persist for one remote file.
// Strictly sequential; one poll is never in flight alongside another.
class Tailer {
public:
  struct Config {
    std::string state_file;  // empty disables checkpointing
    int interval_sec = 15;
  };

  using LineCallback = std::function<void(std::string_view)>;

  Tailer(RemoteReader reader, Config cfg);

  bool load_state(TailError* err = nullptr);
  bool save_state(TailError* err = nullptr);

  PollResult poll_once(const LineCallback& emit);

  // Applies a fetch result to the offset; emits complete lines, then persists.
  PollResult absorb(const FetchResult& fetched, const LineCallback& emit);

  // Polls until `stop` is set, sleeping interval_sec between polls.
  void run(const LineCallback& emit, const std::atomic<bool>& stop);

  std::int64_t offset() const noexcept { return offset_; }
  void set_offset(std::int64_t off) noexcept { offset_ = off; }
  const RemoteReader& reader() const noexcept { return reader_; }
  TailStats stats() const { return stats_.snapshot(); }

private:
  void persist(PollResult& r);

  RemoteReader reader_;
  Config cfg_;
  std::int64_t offset_ = 0;
  StatsRegistry stats_;
};

}
