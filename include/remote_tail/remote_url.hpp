#pragma once
#include <string>
#include <string_view>

namespace rt {

// scheme://[user[:password]@]host[:port][/path][?query]
struct RemoteUrl {
  std::string scheme;    // lower-cased
  std::string username;  // percent-decoded
  std::string password;  // percent-decoded
  bool has_password = false;
  std::string host;      // IPv6 literals keep their brackets
  int port = 0;          // 0 when absent
  std::string path;      // raw, begins with '/' when present
  std::string query;     // without the leading '?'

  // "scheme://host[:port]" as expected by httplib::Client.
  std::string origin() const;
  // path + "?" + query; "/" when the path is empty.
  std::string target() const;
};

// Returns false and sets *err on malformed input. Scheme support is not
// checked here; see make_reader().
bool parse_remote_url(std::string_view text, RemoteUrl& out,
                      std::string* err = nullptr);

// %XX decoding; returns false on a truncated or non-hex escape.
bool percent_decode(std::string_view in, std::string& out);

}
