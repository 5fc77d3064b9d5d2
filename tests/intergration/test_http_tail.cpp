#include "remote_tail/checkpoint_store.hpp"
#include "remote_tail/remote_reader.hpp"
#include "remote_tail/remote_url.hpp"
#include "remote_tail/tailer.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "httplib.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static int failures = 0;

static void expect(bool cond, const char* what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Serves one growing "remote file"; cpp-httplib answers Range requests itself.
struct FakeRemote {
  httplib::Server svr;
  std::mutex mu;
  std::string content;
  int port = -1;
  std::thread th;

  FakeRemote() {
    svr.Get("/log.txt", [this](const httplib::Request&, httplib::Response& res) {
      std::lock_guard<std::mutex> lk(mu);
      res.set_content(content, "text/plain");
    });
    svr.Get("/gone.txt", [](const httplib::Request&, httplib::Response& res) {
      res.status = 404;
    });
    port = svr.bind_to_any_port("127.0.0.1");
    th = std::thread([this] { svr.listen_after_bind(); });
    for (int i = 0; i < 100 && !svr.is_running(); ++i) std::this_thread::sleep_for(10ms);
  }
  ~FakeRemote() { svr.stop(); if (th.joinable()) th.join(); }

  void set(std::string s)    { std::lock_guard<std::mutex> lk(mu); content = std::move(s); }
  void append(const std::string& s) { std::lock_guard<std::mutex> lk(mu); content += s; }
  std::string url(const char* path) const { return "http://127.0.0.1:" + std::to_string(port) + path; }
};

static rt::Tailer make_tailer(const std::string& url_text, const std::string& state) {
  rt::RemoteUrl url;
  if (!rt::parse_remote_url(url_text, url)) std::cerr << "[ERR] bad url " << url_text << "\n";
  rt::ReaderOptions opt;
  opt.timeout_sec = 2;
  auto reader = rt::make_reader(url, opt);
  rt::Tailer::Config cfg;
  cfg.state_file = state;
  cfg.interval_sec = 1;
  return rt::Tailer(std::move(*reader), cfg);
}

static std::int64_t stored(const std::string& path) {
  std::int64_t off = -1;
  if (!rt::load_checkpoint(path, off)) return -1;
  return off;
}

int main() {
  FakeRemote remote;
  if (remote.port <= 0 || !remote.svr.is_running()) { std::cerr << "[ERR] could not start server\n"; return 2; }

  const fs::path dir = fs::temp_directory_path() / ("rt-http-" + std::to_string(std::time(nullptr)));
  fs::remove_all(dir);
  fs::create_directories(dir);
  const std::string state = (dir / "state").string();

  std::vector<std::string> out;
  auto emit = [&](std::string_view l) { out.emplace_back(l); };

  {
    auto tailer = make_tailer(remote.url("/log.txt"), state);
    expect(tailer.load_state() && tailer.offset() == 0, "cold start");

    remote.set("foo\nbar\n");
    auto r = tailer.poll_once(emit);
    expect(r.ok && r.lines == 2 && tailer.offset() == 8, "first poll reads the whole file");

    remote.append("baz");
    r = tailer.poll_once(emit);
    expect(r.ok && r.lines == 0 && tailer.offset() == 8, "partial line is held back");

    remote.append("\n");
    r = tailer.poll_once(emit);
    expect(r.ok && r.lines == 1 && tailer.offset() == 12, "completed line arrives");
    expect(out == std::vector<std::string>{"foo", "bar", "baz"}, "lines in order, once each");
    expect(stored(state) == 12, "checkpoint holds 12");

    const auto& http = std::get<rt::HttpRangeReader>(tailer.reader());
    expect(!http.range_unsupported(), "server honoured Range");
  }

  // restart from the checkpoint: nothing is re-emitted
  {
    auto tailer = make_tailer(remote.url("/log.txt"), state);
    expect(tailer.load_state() && tailer.offset() == 12, "offset restored");
    auto r = tailer.poll_once(emit);
    expect(r.ok && r.lines == 0, "no duplicates after restart");

    remote.append("qux\n");
    r = tailer.poll_once(emit);
    expect(r.lines == 1 && out.back() == "qux" && tailer.offset() == 16, "resumes after restart");

    // rotation to a shorter file
    remote.set("x\n");
    r = tailer.poll_once(emit);
    expect(r.ok && r.truncated && r.lines == 0, "shrunk file detected");
    expect(tailer.offset() == 0 && stored(state) == 0, "offset reset and persisted");

    r = tailer.poll_once(emit);
    expect(r.lines == 1 && out.back() == "x" && tailer.offset() == 2, "rotated file read from the start");
  }

  // protocol errors leave the offset alone
  {
    const std::string state2 = (dir / "state2").string();
    auto tailer = make_tailer(remote.url("/gone.txt"), state2);
    tailer.set_offset(5);
    auto r = tailer.poll_once(emit);
    expect(!r.ok, "404 fails the poll");
    expect(rt::last_error(tailer.reader()).kind == rt::ErrorKind::UnexpectedStatus, "404 is UnexpectedStatus");
    expect(tailer.offset() == 5 && !fs::exists(state2), "offset untouched, nothing persisted");
  }

  // nobody listening: transport error, loop would simply retry
  {
    const std::string state3 = (dir / "state3").string();
    auto tailer = make_tailer("http://127.0.0.1:1/log.txt", state3);
    auto r = tailer.poll_once(emit);
    expect(!r.ok, "connection refused fails the poll");
    expect(rt::last_error(tailer.reader()).kind == rt::ErrorKind::TransportIO, "TransportIO");
    expect(tailer.offset() == 0 && !fs::exists(state3), "no state written on error");
    expect(tailer.stats().failed_polls == 1, "failure counted");
  }

  fs::remove_all(dir);
  if (failures) return 1;
  std::cout << "[PASS] http tail end-to-end\n";
  return 0;
}
