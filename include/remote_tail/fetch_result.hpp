#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace rt {

// What one fetch returned. Never persisted.
struct FetchResult {
  std::string bytes;          // raw span read from the remote file
  std::size_t skip_bytes = 0; // leading bytes already consumed in a prior poll
  bool        truncated  = false;

  // The part of `bytes` that is actually new; empty when skip covers it all.
  std::string_view fresh() const noexcept {
    std::string_view v(bytes);
    return skip_bytes >= v.size() ? std::string_view{} : v.substr(skip_bytes);
  }
};

}
