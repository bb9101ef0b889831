#include "command.hpp"
#include "logging.hpp"
#include "stream_io.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <iostream>
#include <thread>

using namespace byteframe;

int main(int argc, char **argv) {
  std::string server = "127.0.0.1:8080";
  std::string log_level = "info";

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--server")
      server = next(i);
    else if (a == "--log-level")
      log_level = next(i);
    else {
      std::cerr << "unknown option " << a << "\n";
      return 1;
    }
  }

  ClientConfig cfg;
  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);
  Logger::instance().log(LogLevel::DEBUG, "log level %s", log_level_name(lvl));

  if (!parse_host_port(server, cfg.server_host, cfg.server_port)) {
    std::cerr << "bad server" << std::endl;
    return 1;
  }

  asio::io_context io;
  asio::ip::tcp::socket sock(io);
  std::error_code ec;
  asio::ip::tcp::resolver resolver(io);
  auto endpoints = resolver.resolve(cfg.server_host, std::to_string(cfg.server_port), ec);
  if (!ec)
    asio::connect(sock, endpoints, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "connect to %s failed: %s",
                           server.c_str(), ec.message().c_str());
    return 1;
  }
  Logger::instance().log(LogLevel::INFO, "connected to %s", server.c_str());

  std::thread receiver([&sock]() {
    PacketReader<asio::ip::tcp::socket> reader(sock);
    for (;;) {
      Packet p;
      std::error_code rec;
      if (reader.read_packet(p, rec)) {
        std::cout << "<- " << describe(p) << std::endl;
        continue;
      }
      if (rec.category() == frame_category()) {
        Logger::instance().log(LogLevel::WARN, "frame error: %s",
                               rec.message().c_str());
        continue;
      }
      if (rec == asio::error::eof)
        Logger::instance().log(LogLevel::INFO, "server disconnected");
      else if (rec != asio::error::operation_aborted &&
               rec != asio::error::bad_descriptor)
        Logger::instance().log(LogLevel::ERROR, "read error: %s",
                               rec.message().c_str());
      return;
    }
  });

  std::cout << "\nCommands:\n"
            << "  ping          - send a Ping packet\n"
            << "  data <bytes>  - send a Data packet (e.g. 'data 01 02 03')\n"
            << "  <message>     - send a Message packet\n"
            << "  quit          - exit\n"
            << std::endl;

  PacketWriter<asio::ip::tcp::socket> writer(sock);
  std::string line;
  while (std::getline(std::cin, line)) {
    Packet p;
    CommandKind k = parse_command(line, p);
    if (k == CommandKind::QUIT)
      break;
    if (k == CommandKind::EMPTY)
      continue;
    if (k == CommandKind::INVALID) {
      std::cerr << "bad hex bytes" << std::endl;
      continue;
    }
    std::cout << "-> " << describe(p) << std::endl;
    std::error_code wec;
    if (!writer.write_packet(p, wec)) {
      Logger::instance().log(LogLevel::ERROR, "send failed: %s",
                             wec.message().c_str());
      break;
    }
  }

  // unblock the receiver
  std::error_code sec;
  sock.shutdown(asio::ip::tcp::socket::shutdown_both, sec);
  receiver.join();
  sock.close(sec);
  return 0;
}
