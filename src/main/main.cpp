#include "remote_tail/cli.hpp"
#include "remote_tail/errors.hpp"
#include "remote_tail/remote_reader.hpp"
#include "remote_tail/remote_url.hpp"
#include "remote_tail/tailer.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <string_view>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

}

int main(int argc, char** argv) {
  rt::CliOptions cli;
  std::string cli_err;
  if (!rt::parse_cli(argc, argv, cli, cli_err)) {
    std::cerr << cli_err << "\n";
    rt::print_usage(std::cerr, argv[0]);
    return 1;
  }
  if (cli.help) {
    rt::print_usage(std::cout, argv[0]);
    return 0;
  }

  rt::RemoteUrl url;
  std::string url_err;
  if (!rt::parse_remote_url(cli.positional[0], url, &url_err)) {
    std::cerr << "Failed to create tailer: invalid url: " << url_err << "\n";
    return 1;
  }

  rt::ReaderOptions ropt;
  ropt.timeout_sec = cli.request_timeout_sec;
  rt::TailError err;
  auto reader = rt::make_reader(url, ropt, &err);
  if (!reader) {
    std::cerr << "Failed to create tailer: " << err.message << "\n";
    return 1;
  }

  rt::Tailer::Config tcfg;
  tcfg.state_file = cli.state_file;
  tcfg.interval_sec = cli.interval_sec;
  rt::Tailer tailer(std::move(*reader), tcfg);

  if (!tailer.load_state(&err)) {
    std::cerr << "Failed to load state: " << err.message << "\n";
    return 1;
  }
  std::cerr << "[tail] following " << rt::describe(tailer.reader())
            << " from offset " << tailer.offset() << "\n";

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  tailer.run([](std::string_view line) { std::cout << line << std::endl; }, g_stop);

  std::cerr << "[tail] caught signal, saving state and exiting.\n";
  if (!tailer.save_state(&err))
    std::cerr << "[checkpoint] failed to save state: " << err.message << "\n";
  std::cerr << "[tail] " << rt::StatsRegistry::summary(tailer.stats()) << "\n";
  return 0;
}
