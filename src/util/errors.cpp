#include "remote_tail/errors.hpp"
#include <utility>

namespace rt {

std::string_view to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:                     return "ok";
    case ErrorKind::Config:                   return "config";
    case ErrorKind::InvalidCheckpoint:        return "invalid-checkpoint";
    case ErrorKind::CheckpointIO:             return "checkpoint-io";
    case ErrorKind::TransportIO:              return "transport-io";
    case ErrorKind::UnexpectedStatus:         return "unexpected-status";
    case ErrorKind::UnexpectedPartialContent: return "unexpected-partial-content";
  }
  return "unknown";
}

bool fail(TailError* out, ErrorKind kind, std::string message) {
  if (out) {
    out->kind = kind;
    out->message = std::move(message);
  }
  return false;
}

}
