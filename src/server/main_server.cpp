#include "file_server.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <thread>

using namespace chunkcast;

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:" + std::to_string(kDefaultPort);
  ServerConfig cfg;
  cfg.threads = (int)std::max(2u, std::thread::hardware_concurrency());

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
    if (a == "--listen")
      listen = next(i);
    else if (a == "--root")
      cfg.root = next(i);
    else if (a == "--threads")
      cfg.threads = (int)std::max<uint64_t>(1, next_uint(i));
    else if (a == "--max-sessions")
      cfg.max_sessions = (std::size_t)next_uint(i);
    else if (a == "--chunk-min")
      cfg.chunk_min = (std::size_t)next_uint(i);
    else if (a == "--chunk-max")
      cfg.chunk_max = (std::size_t)next_uint(i);
    else if (a == "--pacing-ms")
      cfg.pacing = std::chrono::milliseconds(next_uint(i));
    else if (a == "--ok-delay-ms")
      cfg.ok_delay = std::chrono::milliseconds(next_uint(i));
    else if (a == "--log-level") {
      LogLevel lvl;
      std::string v = next(i);
      if (!parse_log_level(v, lvl)) {
        std::cerr << "bad log level " << v << "\n";
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else {
      std::cerr << "unknown option " << a << "\n";
      return 1;
    }
  }

  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }

  asio::io_context io;
  std::unique_ptr<FileServer> server;
  try {
    server.reset(new FileServer(io, cfg));
    server->start();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "cannot bind %s: %s",
                           listen.c_str(), e.what());
    return 1;
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "bad configuration: %s", e.what());
    return 1;
  }

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "signal %d, shutting down", sig);
    server->stop();
  });

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();
  return 0;
}
