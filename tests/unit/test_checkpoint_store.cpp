#include "remote_tail/checkpoint_store.hpp"
#include <filesystem>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static void write_file(const fs::path& p, const std::string& s) {
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  o << s;
}

static std::string read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

int main(){
  const fs::path dir = fs::temp_directory_path() / ("rt-checkpoint-" + std::to_string(std::time(nullptr)));
  fs::remove_all(dir);
  fs::create_directories(dir);
  const std::string state = (dir / "state").string();

  {
    std::int64_t off = 7;
    rt::TailError err;
    expect(rt::load_checkpoint("", off, &err) && off == 0, "empty path loads 0");
    expect(rt::save_checkpoint("", 99, &err), "empty path save is a no-op");
  }
  {
    std::int64_t off = 7;
    rt::TailError err;
    expect(rt::load_checkpoint(state, off, &err) && off == 0 && err.ok(), "missing file is a cold start");
  }
  {
    rt::TailError err;
    expect(rt::save_checkpoint(state, 123456789012LL, &err), "save succeeds");
    expect(read_file(state) == "123456789012\n", "file holds decimal offset and newline");
    expect(!fs::exists(state + ".tmp"), "temporary file is renamed away");
    std::int64_t off = 0;
    expect(rt::load_checkpoint(state, off, &err) && off == 123456789012LL, "round trip");
  }
  {
    write_file(state, "42");
    std::int64_t off = 0;
    expect(rt::load_checkpoint(state, off) && off == 42, "newline is optional");
  }

  const char* bad[] = {"-5\n", "", "\n", "abc\n", "12 \n", " 12\n", "+12\n", "12\n\n",
                       "1\n2\n", "99999999999999999999\n"};
  for (const char* text : bad) {
    write_file(state, text);
    std::int64_t off = 77;
    rt::TailError err;
    const bool ok = rt::load_checkpoint(state, off, &err);
    expect(!ok && err.kind == rt::ErrorKind::InvalidCheckpoint,
           std::string("rejects checkpoint \"") + text + "\"");
    expect(off == 0, std::string("offset stays 0 for \"") + text + "\"");
  }

  {
    rt::TailError err;
    const std::string nowhere = (dir / "missing-dir" / "state").string();
    expect(!rt::save_checkpoint(nowhere, 5, &err) && err.kind == rt::ErrorKind::CheckpointIO,
           "unwritable location reports CheckpointIO");
  }

  fs::remove_all(dir);
  if (failures) return 1;
  std::cout << "[PASS] checkpoint store\n";
  return 0;
}
