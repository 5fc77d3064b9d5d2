#include "remote_tail/sftp_seek_reader.hpp"
#include <curl/curl.h>
#include <iostream>
#include <mutex>

namespace rt {

namespace {

std::once_flag g_curl_init;

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* sink = static_cast<std::string*>(userdata);
  sink->append(data, size * nmemb);
  return size * nmemb;
}

}

struct SftpSeekReader::Impl {
  Config cfg;
  CURL* curl = nullptr;
  TailError err;
  std::string body;
  char errbuf[CURL_ERROR_SIZE] = {0};

  explicit Impl(Config c) : cfg(std::move(c)) {}
  ~Impl() { disconnect(); }

  std::string url() const {
    std::string u = "sftp://" + cfg.host + ":" + std::to_string(cfg.port > 0 ? cfg.port : 22);
    return u + "/~/" + cfg.path;
  }

  std::string describe(CURLcode rc) const {
    return errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
  }

  bool connect() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    curl = curl_easy_init();
    if (!curl) return fail(&err, ErrorKind::TransportIO, "failed to connect: curl_easy_init failed");

    const std::string target = url();
    const long timeout = cfg.timeout_sec > 0 ? cfg.timeout_sec : 0L;
    curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl, CURLOPT_USERNAME, cfg.username.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, cfg.password.c_str());
    curl_easy_setopt(curl, CURLOPT_SSH_AUTH_TYPES,
                     static_cast<long>(CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD));
    // Only connecting and stalls are bounded; a long backlog may take as long as it needs.
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    return true;
  }

  void disconnect() {
    if (curl) {
      curl_easy_cleanup(curl);
      curl = nullptr;
    }
  }

  bool fetch(std::int64_t offset, FetchResult& out) {
    err.clear();
    out = FetchResult{};
    if (!curl && !connect()) return false;

    body.clear();
    errbuf[0] = '\0';
    curl_easy_setopt(curl, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));

    const CURLcode rc = curl_easy_perform(curl);
    const bool refused = (rc == CURLE_BAD_DOWNLOAD_RESUME);
    if (rc != CURLE_OK && !refused) {
      const std::string why = describe(rc);
      disconnect();
      return fail(&err, ErrorKind::TransportIO,
                  "failed to read " + cfg.path + " from " + std::to_string(offset) + ": " + why);
    }

    curl_off_t remaining = -1;
    if (!refused && curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &remaining) != CURLE_OK)
      remaining = -1;

    switch (classify(offset, refused, static_cast<std::int64_t>(remaining), body.size())) {
      case Outcome::Truncated:
        std::cerr << "[sftp] " << cfg.path << " is shorter than offset " << offset
                  << ", file was probably truncated. Resetting state.\n";
        out.truncated = true;
        return true;
      case Outcome::SizeUnknown:
        disconnect();
        return fail(&err, ErrorKind::TransportIO,
                    "failed to stat " + cfg.path + ": server reported no file size");
      case Outcome::UpToDate:
        body.clear();
        return true;
      case Outcome::Fresh:
        break;
    }

    out.bytes = std::move(body);
    body = std::string();
    return true;
  }
};

SftpSeekReader::Outcome SftpSeekReader::classify(std::int64_t offset, bool resume_refused,
                                                 std::int64_t remaining, std::size_t received) {
  if (resume_refused) return Outcome::Truncated;
  if (remaining == 0) return Outcome::UpToDate;
  if (remaining > 0) return Outcome::Fresh;
  // No size: libcurl neither checked nor applied the offset.
  if (offset == 0) return received == 0 ? Outcome::UpToDate : Outcome::Fresh;
  if (received == 0) return Outcome::Truncated; // empty file, e.g. copytruncate
  return Outcome::SizeUnknown;
}

SftpSeekReader::SftpSeekReader(Config cfg) : p_(std::make_unique<Impl>(std::move(cfg))) {}
SftpSeekReader::~SftpSeekReader() = default;
SftpSeekReader::SftpSeekReader(SftpSeekReader&&) noexcept = default;
SftpSeekReader& SftpSeekReader::operator=(SftpSeekReader&&) noexcept = default;

bool SftpSeekReader::fetch(std::int64_t offset, FetchResult& out) { return p_->fetch(offset, out); }
bool SftpSeekReader::connected() const noexcept { return p_->curl != nullptr; }
void SftpSeekReader::disconnect() { p_->disconnect(); }
const TailError& SftpSeekReader::last_error() const noexcept { return p_->err; }
const SftpSeekReader::Config& SftpSeekReader::config() const noexcept { return p_->cfg; }
std::string SftpSeekReader::transfer_url() const { return p_->url(); }

}
