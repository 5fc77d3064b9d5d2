#pragma once
#include "remote_tail/errors.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace rt {

// Checkpoint file: one decimal byte offset followed by '\n'.
//
// An empty path disables checkpointing: load yields 0, save does nothing.
// A missing file is a cold start (offset 0), not an error.
bool load_checkpoint(const std::string& path, std::int64_t& offset,
                     TailError* err = nullptr);

// Replaces the file via a temporary sibling + rename.
bool save_checkpoint(const std::string& path, std::int64_t offset,
                     TailError* err = nullptr);

// Parses checkpoint text; exposed for tests.
bool parse_checkpoint(std::string_view text, std::int64_t& offset,
                      TailError* err = nullptr);

}
