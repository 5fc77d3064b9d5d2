#pragma once
#include "remote_tail/errors.hpp"
#include "remote_tail/fetch_result.hpp"
#include "remote_tail/http_range_reader.hpp"
#include "remote_tail/remote_url.hpp"
#include "remote_tail/sftp_seek_reader.hpp"
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace rt {

using RemoteReader = std::variant<HttpRangeReader, SftpSeekReader>;

inline constexpr const char* kSftpPasswordEnv = "SFTP_PASSWORD";

struct ReaderOptions {
  int timeout_sec = 5;
  // Environment lookup used for SFTP_PASSWORD; std::getenv when empty.
  std::function<std::string(const std::string&)> env;
};

// Picks the reader by URL scheme: http/https -> HttpRangeReader,
// sftp -> SftpSeekReader. Anything else, a missing SFTP password (URL and
// environment) or a missing SFTP file path is an ErrorKind::Config error.
std::optional<RemoteReader> make_reader(const RemoteUrl& url,
                                        const ReaderOptions& opt,
                                        TailError* err = nullptr);

bool fetch(RemoteReader& reader, std::int64_t offset, FetchResult& out);
const TailError& last_error(const RemoteReader& reader);
std::string describe(const RemoteReader& reader);

}
