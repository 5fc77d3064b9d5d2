#pragma once
#include "remote_tail/errors.hpp"
#include "remote_tail/fetch_result.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace rt {

// Tails a file over SFTP by resuming the transfer at the stored offset.
//
// The session (a libcurl easy handle, which keeps the SSH connection cached
// between transfers) is opened lazily and dropped on any failure, so the next
// fetch reconnects from scratch. skip_bytes is always 0: resuming gives an
// exact continuation point.
class SftpSeekReader {
public:
  // How one resumed transfer relates to the stored offset.
  enum class Outcome {
    Fresh,        // bytes from offset to EOF
    UpToDate,     // remote size == offset
    Truncated,    // remote size < offset
    SizeUnknown   // no usable stat; the bytes cannot be placed
  };

  // Decides from what the transfer reported. `resume_refused` is libcurl's
  // CURLE_BAD_DOWNLOAD_RESUME; `remaining` is the size it announced after
  // stat (remote size - offset), -1 when the stat gave no size or the file
  // was empty, in which case libcurl read from byte 0 instead of seeking.
  static Outcome classify(std::int64_t offset, bool resume_refused,
                          std::int64_t remaining, std::size_t received);

  struct Config {
    std::string host;       // as written in the URL, IPv6 in brackets
    int port = 0;           // 0 -> 22
    std::string username;
    std::string password;
    std::string path;       // relative to the login directory
    int timeout_sec = 5;
  };

  explicit SftpSeekReader(Config cfg);
  ~SftpSeekReader();
  SftpSeekReader(SftpSeekReader&&) noexcept;
  SftpSeekReader& operator=(SftpSeekReader&&) noexcept;

  bool fetch(std::int64_t offset, FetchResult& out);

  bool connected() const noexcept;
  void disconnect();

  const TailError& last_error() const noexcept;
  const Config& config() const noexcept;

  // sftp://host:port/~/path (no credentials).
  std::string transfer_url() const;

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}
