#pragma once
#include "remote_tail/errors.hpp"
#include "remote_tail/fetch_result.hpp"
#include <cstdint>
#include <string>

namespace rt {

// The parts of an HTTP response the reader cares about.
struct HttpReply {
  int status = 0;
  std::string body;
  std::string content_range; // empty when absent
};

// Tails a file over HTTP(S) with "Range: bytes=<offset-1>-".
//
// The range starts one byte early so a 206 always carries a byte we have
// already seen (dropped via skip_bytes = 1). A server that ignores the
// header answers 200 with the whole file; the already consumed prefix is
// then skipped and a warning is printed once per reader.
class HttpRangeReader {
public:
  struct Config {
    std::string origin;   // scheme://host[:port]
    std::string target;   // path?query
    std::string username; // basic auth when non-empty
    std::string password;
    int timeout_sec = 5;
  };

  explicit HttpRangeReader(Config cfg);

  // Issues one GET; false on failure (see last_error()).
  bool fetch(std::int64_t offset, FetchResult& out);

  // Classifies a reply received for a request made at `offset`.
  bool interpret(std::int64_t offset, HttpReply reply, FetchResult& out);

  bool range_unsupported() const noexcept { return range_unsupported_; }
  const TailError& last_error() const noexcept { return err_; }
  const Config& config() const noexcept { return cfg_; }

  // "bytes=<offset-1>-", or "" when offset == 0.
  static std::string range_header(std::int64_t offset);
  // Total length from "bytes a-b/total"; -1 when absent or "*".
  static std::int64_t content_range_total(const std::string& header);

private:
  Config cfg_;
  bool range_unsupported_ = false;
  std::int64_t last_total_ = -1; // remote size seen on the previous reply
  TailError err_;
};

}
