#include "remote_tail/remote_reader.hpp"
#include <cstdlib>
#include <type_traits>

namespace rt {

static std::string lookup_env(const ReaderOptions& opt, const std::string& key) {
  if (opt.env) return opt.env(key);
  const char* v = std::getenv(key.c_str());
  return v ? std::string(v) : std::string();
}

std::optional<RemoteReader> make_reader(const RemoteUrl& url,
                                        const ReaderOptions& opt,
                                        TailError* err) {
  if (url.scheme == "http" || url.scheme == "https") {
    HttpRangeReader::Config cfg;
    cfg.origin = url.origin();
    cfg.target = url.target();
    cfg.username = url.username;
    cfg.password = url.password;
    cfg.timeout_sec = opt.timeout_sec;
    return RemoteReader(std::in_place_type<HttpRangeReader>, std::move(cfg));
  }

  if (url.scheme == "sftp") {
    std::string password = url.password;
    if (password.empty()) password = lookup_env(opt, kSftpPasswordEnv);
    if (password.empty()) {
      fail(err, ErrorKind::Config,
           std::string("provide password in URL or through ") + kSftpPasswordEnv +
           " environment variable");
      return std::nullopt;
    }
    if (url.path.size() < 2) {
      fail(err, ErrorKind::Config, "missing file path");
      return std::nullopt;
    }
    SftpSeekReader::Config cfg;
    cfg.host = url.host;
    cfg.port = url.port;
    cfg.username = url.username;
    cfg.password = std::move(password);
    cfg.path = url.path.substr(1);
    cfg.timeout_sec = opt.timeout_sec;
    return RemoteReader(std::in_place_type<SftpSeekReader>, std::move(cfg));
  }

  fail(err, ErrorKind::Config, "invalid protocol: " + url.scheme);
  return std::nullopt;
}

bool fetch(RemoteReader& reader, std::int64_t offset, FetchResult& out) {
  return std::visit([&](auto& r) { return r.fetch(offset, out); }, reader);
}

const TailError& last_error(const RemoteReader& reader) {
  return std::visit([](const auto& r) -> const TailError& { return r.last_error(); }, reader);
}

std::string describe(const RemoteReader& reader) {
  return std::visit([](const auto& r) -> std::string {
    using T = std::decay_t<decltype(r)>;
    if constexpr (std::is_same_v<T, HttpRangeReader>) {
      return r.config().origin + r.config().target;
    } else {
      return r.transfer_url();
    }
  }, reader);
}

}
