#include "testutil.hpp"

#include "command.hpp"
#include "echo_server.hpp"
#include "stream_io.hpp"

#include <unity.h>
#include <thread>

using namespace byteframe;

void setUp() {}

void tearDown() {}

void test_reply_for() {
  TEST_ASSERT_TRUE(EchoServer::reply_for(Ping{}) == Packet{Pong{}});
  TEST_ASSERT_TRUE(EchoServer::reply_for(Pong{}) == Packet{Pong{}});
  TEST_ASSERT_TRUE(EchoServer::reply_for(Message{"x"}) == Packet{Message{"x"}});
  TEST_ASSERT_TRUE(EchoServer::reply_for(Data{{7}}) == Packet{Data{{7}}});
}

void test_parse_command() {
  Packet p;
  TEST_ASSERT_TRUE(parse_command("  ping ", p) == CommandKind::SEND);
  TEST_ASSERT_TRUE(p == Packet{Ping{}});

  const Packet spaced = Data{{0x01, 0x02, 0xFF}};
  TEST_ASSERT_TRUE(parse_command("data 01 02 ff", p) == CommandKind::SEND);
  TEST_ASSERT_TRUE(p == spaced);

  const Packet packed = Data{{0x0A, 0x0B}};
  TEST_ASSERT_TRUE(parse_command("data 0a0b", p) == CommandKind::SEND);
  TEST_ASSERT_TRUE(p == packed);

  TEST_ASSERT_TRUE(parse_command("data zz", p) == CommandKind::INVALID);
  TEST_ASSERT_TRUE(parse_command("quit", p) == CommandKind::QUIT);
  TEST_ASSERT_TRUE(parse_command(" \t", p) == CommandKind::EMPTY);

  TEST_ASSERT_TRUE(parse_command("hello there", p) == CommandKind::SEND);
  TEST_ASSERT_TRUE(p == Packet{Message{"hello there"}});
}

void test_parse_log_level() {
  LogLevel lvl = LogLevel::INFO;
  TEST_ASSERT_TRUE(parse_log_level("warn", lvl));
  TEST_ASSERT_TRUE(lvl == LogLevel::WARN);
  TEST_ASSERT_TRUE(parse_log_level("trace", lvl));
  TEST_ASSERT_TRUE(lvl == LogLevel::TRACE);
  TEST_ASSERT_FALSE(parse_log_level("WARN", lvl));
  TEST_ASSERT_TRUE(lvl == LogLevel::TRACE);
  TEST_ASSERT_EQUAL_STRING("error", log_level_name(LogLevel::ERROR));
}

void test_log_from_many_threads() {
  Logger &log = Logger::instance();
  LogLevel saved = log.level();
  log.set_level(LogLevel::DEBUG);
  TEST_ASSERT_TRUE(log.enabled(LogLevel::WARN));
  TEST_ASSERT_FALSE(log.enabled(LogLevel::TRACE));

  std::vector<std::thread> th;
  for (int t = 0; t < 4; t++)
    th.emplace_back([&log, t]() {
      for (int i = 0; i < 8; i++)
        log.log(LogLevel::DEBUG, "logger thread %d line %d", t, i);
    });
  for (auto &t : th)
    t.join();

  log.set_level(saved);
  TEST_ASSERT_TRUE(log.level() == saved);
}

void test_server_round_trip() {
  asio::io_context io;
  ServerConfig cfg;
  cfg.listen_host = "127.0.0.1";
  cfg.listen_port = 0;
  EchoServer srv(io, cfg);
  srv.start();
  uint16_t port = srv.local_port();
  TEST_ASSERT_TRUE(port != 0);

  auto guard = asio::make_work_guard(io);
  std::thread runner([&io]() { io.run(); });

  asio::io_context cio;
  asio::ip::tcp::socket sock(cio);
  sock.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  PacketReader<asio::ip::tcp::socket> reader(sock);
  PacketWriter<asio::ip::tcp::socket> writer(sock);

  TEST_ASSERT_TRUE(reader.read_packet() ==
                   Packet{Message{"Welcome to echo server!"}});

  writer.write_packet(Ping{});
  TEST_ASSERT_TRUE(reader.read_packet() == Packet{Pong{}});

  const Packet data = Data{{1, 2, 3}};
  writer.write_packet(data);
  TEST_ASSERT_TRUE(reader.read_packet() == data);

  // garbage in front of a frame is skipped by the server's decoder
  const uint8_t junk[] = {0x00, 0x01, 0xAA, 0x02};
  asio::write(sock, asio::buffer(junk));
  writer.write_packet(Message{"still in sync"});
  TEST_ASSERT_TRUE(reader.read_packet() == Packet{Message{"still in sync"}});

  std::error_code ec;
  sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  sock.close(ec);
  srv.stop();
  guard.reset();
  io.stop();
  runner.join();
}

int main(void) {
  UNITY_BEGIN();

  setup_test_environment();

  RUN_TEST(test_reply_for);
  RUN_TEST(test_parse_command);
  RUN_TEST(test_parse_log_level);
  RUN_TEST(test_log_from_many_threads);
  RUN_TEST(test_server_round_trip);

  return UNITY_END();
}
