#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rt {

struct Extraction {
  std::vector<std::string> lines;
  std::int64_t new_offset = 0;
};

// Splits `buffer` (which begins exactly at `start_offset` in the remote file)
// into '\n'-terminated lines. The newline is dropped, nothing else is trimmed.
// Bytes after the last newline are left unconsumed: they are neither emitted
// nor counted into new_offset, so the next fetch sees them again.
Extraction extract_lines(std::string_view buffer, std::int64_t start_offset);

}
