#include "remote_tail/checkpoint_store.hpp"
#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace rt {

bool parse_checkpoint(std::string_view text, std::int64_t& offset, TailError* err) {
  std::string_view digits = text;
  if (!digits.empty() && digits.back() == '\n') digits.remove_suffix(1);
  if (digits.empty())
    return fail(err, ErrorKind::InvalidCheckpoint, "checkpoint file is empty");

  std::int64_t v = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
  if (ec == std::errc::result_out_of_range)
    return fail(err, ErrorKind::InvalidCheckpoint, "checkpoint offset out of range");
  if (ec != std::errc() || ptr != digits.data() + digits.size())
    return fail(err, ErrorKind::InvalidCheckpoint,
                "checkpoint is not a decimal integer: \"" + std::string(digits) + "\"");
  if (v < 0)
    return fail(err, ErrorKind::InvalidCheckpoint,
                "invalid offset in checkpoint file: " + std::to_string(v));
  offset = v;
  return true;
}

bool load_checkpoint(const std::string& path, std::int64_t& offset, TailError* err) {
  offset = 0;
  if (path.empty()) return true;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) return fail(err, ErrorKind::CheckpointIO,
                        "could not stat checkpoint file " + path + ": " + ec.message());
    return true; // cold start
  }

  std::ifstream in(path, std::ios::binary);
  if (!in)
    return fail(err, ErrorKind::CheckpointIO,
                "could not read checkpoint file " + path + ": " + std::strerror(errno));
  std::ostringstream ss; ss << in.rdbuf();
  if (in.bad())
    return fail(err, ErrorKind::CheckpointIO, "read error on checkpoint file " + path);

  std::int64_t v = 0;
  if (!parse_checkpoint(ss.str(), v, err)) {
    if (err) err->message = path + ": " + err->message;
    return false;
  }
  offset = v;
  return true;
}

bool save_checkpoint(const std::string& path, std::int64_t offset, TailError* err) {
  if (path.empty()) return true;

  const std::string tmp = path + ".tmp";
  const std::string data = std::to_string(offset) + "\n";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      return fail(err, ErrorKind::CheckpointIO,
                  "could not open " + tmp + ": " + std::strerror(errno));
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out)
      return fail(err, ErrorKind::CheckpointIO, "could not write " + tmp);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return fail(err, ErrorKind::CheckpointIO,
                "could not replace checkpoint file " + path + ": " + ec.message());
  }
  return true;
}

}
