#include "remote_tail/line_extractor.hpp"

namespace rt {

Extraction extract_lines(std::string_view buffer, std::int64_t start_offset) {
  Extraction out;
  out.new_offset = start_offset;

  std::size_t start = 0;
  while (true) {
    const std::size_t pos = buffer.find('\n', start);
    if (pos == std::string_view::npos) break; // partial tail stays unconsumed
    out.lines.emplace_back(buffer.substr(start, pos - start));
    out.new_offset += static_cast<std::int64_t>(pos - start + 1);
    start = pos + 1;
  }
  return out;
}

}
