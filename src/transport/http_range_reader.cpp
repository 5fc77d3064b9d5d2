#include "remote_tail/http_range_reader.hpp"
#include <httplib.h>
#include <charconv>
#include <iostream>

namespace rt {

HttpRangeReader::HttpRangeReader(Config cfg) : cfg_(std::move(cfg)) {}

std::string HttpRangeReader::range_header(std::int64_t offset) {
  if (offset <= 0) return {};
  return "bytes=" + std::to_string(offset - 1) + "-";
}

std::int64_t HttpRangeReader::content_range_total(const std::string& header) {
  const auto slash = header.rfind('/');
  if (slash == std::string::npos) return -1;
  const char* b = header.data() + slash + 1;
  const char* e = header.data() + header.size();
  std::int64_t total = -1;
  auto [ptr, ec] = std::from_chars(b, e, total);
  if (ec != std::errc() || ptr != e || total < 0) return -1; // includes "*"
  return total;
}

bool HttpRangeReader::fetch(std::int64_t offset, FetchResult& out) {
  err_.clear();
  out = FetchResult{};

  httplib::Client cli(cfg_.origin);
  if (!cli.is_valid())
    return fail(&err_, ErrorKind::TransportIO,
                "cannot create HTTP client for " + cfg_.origin +
                " (https requires a build with OpenSSL)");
  cli.set_connection_timeout(cfg_.timeout_sec, 0);
  cli.set_read_timeout(cfg_.timeout_sec, 0);
  cli.set_write_timeout(cfg_.timeout_sec, 0);
  cli.set_follow_location(true);
  if (!cfg_.username.empty()) cli.set_basic_auth(cfg_.username.c_str(), cfg_.password.c_str());

  httplib::Headers headers;
  if (offset > 0) headers.emplace("Range", range_header(offset));

  auto res = cli.Get(cfg_.target, headers);
  if (!res)
    return fail(&err_, ErrorKind::TransportIO,
                "GET " + cfg_.origin + cfg_.target + ": " + httplib::to_string(res.error()));

  HttpReply reply;
  reply.status = res->status;
  reply.body = std::move(res->body);
  reply.content_range = res->get_header_value("Content-Range");
  return interpret(offset, std::move(reply), out);
}

bool HttpRangeReader::interpret(std::int64_t offset, HttpReply reply, FetchResult& out) {
  err_.clear();
  out = FetchResult{};

  if (reply.status == 416) {
    std::cerr << "[http] server returned 416, file was probably truncated. Resetting state.\n";
    last_total_ = -1;
    out.truncated = true;
    return true;
  }
  if (reply.status != 200 && reply.status != 206)
    return fail(&err_, ErrorKind::UnexpectedStatus,
                "unexpected HTTP status: " + std::to_string(reply.status));
  if (reply.status == 206 && offset == 0)
    return fail(&err_, ErrorKind::UnexpectedPartialContent,
                "expected 200, got 206 for a request without Range");

  const std::int64_t total = (reply.status == 206)
      ? content_range_total(reply.content_range)
      : static_cast<std::int64_t>(reply.body.size());
  if (total >= 0 && last_total_ >= 0 && total < last_total_) {
    std::cerr << "[http] total length decreased (old " << last_total_ << ", new " << total
              << "), file was probably truncated. Resetting state.\n";
    last_total_ = -1;
    out.truncated = true;
    return true;
  }

  std::size_t skip = 0;
  if (reply.status == 206) {
    // Assumes the body starts at the requested byte; Content-Range start is not checked.
    skip = 1;
  } else if (offset > 0) {
    if (!range_unsupported_) {
      std::cerr << "[http] server doesn't support range requests, downloading the whole file on every poll.\n";
      range_unsupported_ = true;
    }
    if (static_cast<std::int64_t>(reply.body.size()) < offset) {
      std::cerr << "[http] file is shorter than the stored offset (" << reply.body.size()
                << " < " << offset << "), file was probably truncated. Resetting state.\n";
      last_total_ = -1;
      out.truncated = true;
      return true;
    }
    skip = static_cast<std::size_t>(offset);
  }
  if (total >= 0) last_total_ = total;

  if (reply.body.empty()) std::cerr << "[http] empty response.\n";

  out.bytes = std::move(reply.body);
  out.skip_bytes = skip;
  return true;
}

}
