#include "console_sink.hpp"
#include "file_server.hpp"
#include "logging.hpp"
#include "receive_engine.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <unistd.h>

using namespace chunkcast;

int main(int argc, char **argv) {
  std::string server = "127.0.0.1:" + std::to_string(kDefaultPort);
  std::string serve_root;
  ClientConfig cfg;
  std::vector<std::string> files;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto next_uint = [&](int &i) -> uint64_t {
      std::string v = next(i);
      uint64_t out = 0;
      if (!parse_uint(v, out)) {
        std::cerr << "bad value for " << a << ": " << v << "\n";
        std::exit(1);
      }
      return out;
    };
    if (a == "--server")
      server = next(i);
    else if (a == "--threshold")
      cfg.playback_threshold = next_uint(i);
    else if (a == "--control-timeout-ms")
      cfg.control_timeout = std::chrono::milliseconds(next_uint(i));
    else if (a == "--chunk-timeout-ms")
      cfg.chunk_timeout = std::chrono::milliseconds(next_uint(i));
    else if (a == "--output-dir")
      cfg.output_dir = next(i);
    else if (a == "--prefix")
      cfg.output_prefix = next(i);
    else if (a == "--serve-root")
      serve_root = next(i);
    else if (a == "--log-level") {
      LogLevel lvl;
      std::string v = next(i);
      if (!parse_log_level(v, lvl)) {
        std::cerr << "bad log level " << v << "\n";
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
      std::cerr << "unknown option " << a << "\n";
      return 1;
    } else
      files.push_back(a);
  }

  if (!parse_host_port(server, cfg.server_host, cfg.server_port)) {
    std::cerr << "bad server" << std::endl;
    return 1;
  }

  // Embedded server: same process, own io_context and thread.
  asio::io_context server_io;
  std::unique_ptr<FileServer> embedded;
  std::thread server_thread;
  if (!serve_root.empty()) {
    ServerConfig scfg;
    scfg.listen_host = "0.0.0.0";
    scfg.listen_port = cfg.server_port;
    scfg.root = serve_root;
    try {
      embedded.reset(new FileServer(server_io, scfg));
      embedded->start();
    } catch (const std::exception &e) {
      Logger::instance().log(LogLevel::ERROR, "embedded server failed: %s",
                             e.what());
      return 1;
    }
    server_thread = std::thread([&]() { server_io.run(); });
  }

  StatusChannel status;
  ConsoleSink sink(status, std::cout);
  sink.start();

  OutputClaims claims;
  std::mutex mtx;
  int failures = 0;
  std::vector<std::thread> workers;
  auto request = [&](const std::string &name) {
    workers.emplace_back([&, name]() {
      ReceiveEngine engine(cfg, status, &claims);
      if (engine.run(name) != SessionOutcome::Complete) {
        std::lock_guard<std::mutex> lk(mtx);
        failures++;
      }
    });
  };

  if (!files.empty()) {
    for (auto &f : files)
      request(f);
  } else {
    if (isatty(STDIN_FILENO))
      std::cout << "System: Enter the multimedia filename (e.g., 18.mp4)."
                << std::endl;
    std::string line;
    while (std::getline(std::cin, line)) {
      std::string name = trim_copy(line);
      if (!name.empty())
        request(name);
    }
  }

  for (auto &t : workers)
    t.join();
  sink.stop();

  if (embedded) {
    embedded->stop();
    server_thread.join();
  }
  return failures == 0 ? 0 : 1;
}
