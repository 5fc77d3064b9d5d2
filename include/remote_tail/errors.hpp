#pragma once
#include <string>
#include <string_view>

namespace rt {

enum class ErrorKind {
  None,
  Config,                   // bad URL / scheme / missing credential
  InvalidCheckpoint,        // unparsable or negative persisted offset
  CheckpointIO,             // checkpoint file could not be read or written
  TransportIO,              // connect, request, timeout, read failures
  UnexpectedStatus,         // HTTP status other than 200/206/416
  UnexpectedPartialContent  // 206 for a request that carried no Range
};

struct TailError {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool ok() const noexcept { return kind == ErrorKind::None; }
  void clear() { kind = ErrorKind::None; message.clear(); }
};

std::string_view to_string(ErrorKind k) noexcept;

// Fills *out (if non-null) and returns false, so callers can `return fail(...)`.
bool fail(TailError* out, ErrorKind kind, std::string message);

}
