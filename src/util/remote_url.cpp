#include "remote_tail/remote_url.hpp"
#include <cctype>
#include <charconv>

namespace rt {

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool set_err(std::string* err, const char* msg) {
  if (err) *err = msg;
  return false;
}

bool percent_decode(std::string_view in, std::string& out) {
  out.clear();
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') { out.push_back(in[i]); continue; }
    if (i + 2 >= in.size()) return false;
    int hi = hex_val(in[i + 1]), lo = hex_val(in[i + 2]);
    if (hi < 0 || lo < 0) return false;
    out.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  return true;
}

bool parse_remote_url(std::string_view text, RemoteUrl& out, std::string* err) {
  out = RemoteUrl{};

  const auto sep = text.find("://");
  if (sep == std::string_view::npos || sep == 0)
    return set_err(err, "missing scheme");
  for (char c : text.substr(0, sep)) {
    if (!std::isalnum((unsigned char)c) && c != '+' && c != '-' && c != '.')
      return set_err(err, "invalid character in scheme");
    out.scheme.push_back(static_cast<char>(std::tolower((unsigned char)c)));
  }

  std::string_view rest = text.substr(sep + 3);
  if (auto hash = rest.find('#'); hash != std::string_view::npos)
    rest = rest.substr(0, hash);

  const auto auth_end = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, auth_end);
  std::string_view tail = (auth_end == std::string_view::npos)
                              ? std::string_view{} : rest.substr(auth_end);

  // userinfo: the last '@' wins so passwords may contain unescaped '@'
  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    std::string_view userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
    std::string_view user = userinfo, pass;
    if (auto colon = userinfo.find(':'); colon != std::string_view::npos) {
      user = userinfo.substr(0, colon);
      pass = userinfo.substr(colon + 1);
      out.has_password = true;
    }
    if (!percent_decode(user, out.username) || !percent_decode(pass, out.password))
      return set_err(err, "invalid percent-encoding in userinfo");
  }

  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) return set_err(err, "unterminated IPv6 literal");
    out.host = std::string(authority.substr(0, close + 1));
    std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') return set_err(err, "garbage after IPv6 literal");
      port_text = after.substr(1);
      if (port_text.empty()) return set_err(err, "empty port");
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      port_text = authority.substr(colon + 1);
      authority = authority.substr(0, colon);
      if (port_text.empty()) return set_err(err, "empty port");
    }
    out.host = std::string(authority);
  }
  if (out.host.empty()) return set_err(err, "missing host");

  if (!port_text.empty()) {
    int port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port <= 0 || port > 65535)
      return set_err(err, "invalid port");
    out.port = port;
  }

  const auto q = tail.find('?');
  out.path = std::string(tail.substr(0, q));
  if (q != std::string_view::npos) out.query = std::string(tail.substr(q + 1));
  return true;
}

std::string RemoteUrl::origin() const {
  std::string o = scheme + "://" + host;
  if (port > 0) o += ":" + std::to_string(port);
  return o;
}

std::string RemoteUrl::target() const {
  std::string t = path.empty() ? std::string("/") : path;
  if (!query.empty()) t += "?" + query;
  return t;
}

}
