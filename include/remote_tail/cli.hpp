#pragma once
#include <iosfwd>
#include <string>
#include <vector>

namespace rt {

struct CliOptions {
  int interval_sec = 15;         // >= 0; 0 polls back-to-back
  int request_timeout_sec = 5;   // > 0
  std::string state_file;
  std::vector<std::string> positional;
  bool help = false;
};

void print_usage(std::ostream& os, const char* argv0);

// Accepts --name=value, --name value and the single-dash spellings.
// On success with help unset, positional holds exactly one URL.
bool parse_cli(int argc, const char* const* argv, CliOptions& c, std::string& err);

}
