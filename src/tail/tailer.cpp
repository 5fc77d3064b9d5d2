#include "remote_tail/tailer.hpp"
#include "remote_tail/checkpoint_store.hpp"
#include "remote_tail/line_extractor.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace rt {

Tailer::Tailer(RemoteReader reader, Config cfg)
  : reader_(std::move(reader)), cfg_(std::move(cfg)) {}

bool Tailer::load_state(TailError* err) {
  std::int64_t off = 0;
  if (!load_checkpoint(cfg_.state_file, off, err)) return false;
  offset_ = off;
  return true;
}

bool Tailer::save_state(TailError* err) {
  return save_checkpoint(cfg_.state_file, offset_, err);
}

void Tailer::persist(PollResult& r) {
  TailError err;
  if (save_state(&err)) return;
  std::cerr << "[checkpoint] failed to save state: " << err.message << "\n";
  stats_.add_checkpoint_failure();
  r.checkpoint_saved = false;
}

PollResult Tailer::poll_once(const LineCallback& emit) {
  stats_.add_poll();

  FetchResult fetched;
  if (!fetch(reader_, offset_, fetched)) {
    const TailError& e = last_error(reader_);
    std::cerr << "[tail] error fetching file (" << to_string(e.kind) << "): " << e.message << "\n";
    stats_.add_failure();
    PollResult r;
    r.ok = false;
    return r;
  }
  return absorb(fetched, emit);
}

PollResult Tailer::absorb(const FetchResult& fetched, const LineCallback& emit) {
  PollResult r;

  if (fetched.truncated) {
    offset_ = 0;
    r.truncated = true;
    stats_.add_truncation();
    persist(r);
    return r;
  }

  const std::int64_t before = offset_;
  Extraction ex = extract_lines(fetched.fresh(), offset_);
  for (const auto& line : ex.lines) emit(line);
  offset_ = ex.new_offset;

  r.lines = ex.lines.size();
  stats_.add_lines(r.lines, static_cast<std::uint64_t>(offset_ - before));
  persist(r);
  return r;
}

void Tailer::run(const LineCallback& emit, const std::atomic<bool>& stop) {
  using namespace std::chrono;
  const auto interval = seconds(cfg_.interval_sec > 0 ? cfg_.interval_sec : 0);
  const auto slice = milliseconds(100);

  while (!stop.load()) {
    (void)poll_once(emit);

    const auto wake = steady_clock::now() + interval;
    while (!stop.load() && steady_clock::now() < wake) {
      std::this_thread::sleep_for(std::min<steady_clock::duration>(slice, wake - steady_clock::now()));
    }
  }
}

}
