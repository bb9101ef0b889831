#include "echo_server.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <thread>

using namespace byteframe;

int main(int argc, char **argv) {
  std::string listen = "127.0.0.1:8080";
  int threads = 2;
  size_t max_payload = kMaxPayloadLen;
  std::string resync = "header";
  std::string log_level = "info";

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    try {
      if (a == "--listen")
        listen = next(i);
      else if (a == "--threads")
        threads = std::stoi(next(i));
      else if (a == "--max-payload")
        max_payload = (size_t)std::stoul(next(i));
      else if (a == "--resync")
        resync = next(i);
      else if (a == "--log-level")
        log_level = next(i);
      else {
        std::cerr << "unknown option " << a << "\n";
        return 1;
      }
    } catch (const std::exception &) {
      std::cerr << "bad value for " << a << "\n";
      return 1;
    }
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);
  Logger::instance().log(LogLevel::DEBUG, "log level %s", log_level_name(lvl));

  std::string host;
  uint16_t port;
  if (!parse_host_port(listen, host, port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }

  ServerConfig cfg;
  cfg.listen_host = host;
  cfg.listen_port = port;
  cfg.threads = std::max(1, threads);
  cfg.decoder.max_payload = std::min(max_payload, kMaxPayloadLen);
  if (resync == "header")
    cfg.decoder.on_checksum_mismatch = ResyncPolicy::SKIP_HEADER;
  else if (resync == "frame")
    cfg.decoder.on_checksum_mismatch = ResyncPolicy::SKIP_FRAME;
  else {
    std::cerr << "bad resync policy (header|frame)" << std::endl;
    return 1;
  }

  asio::io_context io;
  EchoServer srv(io, cfg);
  try {
    srv.start();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "listen on %s failed: %s",
                           listen.c_str(), e.what());
    return 1;
  }

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code, int) {
    Logger::instance().log(LogLevel::INFO, "shutting down");
    srv.stop();
    io.stop();
  });

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();
  return 0;
}
