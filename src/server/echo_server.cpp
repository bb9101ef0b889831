#include "echo_server.hpp"
#include "codec.hpp"
#include "logging.hpp"

namespace byteframe {

EchoServer::EchoServer(asio::io_context &io, const ServerConfig &cfg)
    : io_(io), cfg_(cfg), acceptor_(io) {}

void EchoServer::start() {
  asio::ip::tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host),
                             cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  Logger::instance().log(LogLevel::INFO, "echo server listening on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)local_port());
  do_accept();
}

void EchoServer::stop() {
  std::error_code ec;
  acceptor_.close(ec);
}

uint16_t EchoServer::local_port() const {
  std::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

Packet EchoServer::reply_for(const Packet &p) {
  if (std::holds_alternative<Ping>(p))
    return Pong{};
  return p;
}

void EchoServer::do_accept() {
  auto c = std::make_shared<Conn>(io_, cfg_.decoder);
  acceptor_.async_accept(c->sock, [this, c](std::error_code ec) {
    if (ec == asio::error::operation_aborted)
      return;
    if (!ec) {
      std::error_code pec;
      auto ep = c->sock.remote_endpoint(pec);
      c->peer = pec ? std::string("?")
                    : ep.address().to_string() + ":" + std::to_string(ep.port());
      Logger::instance().log(LogLevel::INFO, "[%s] client connected",
                             c->peer.c_str());
      asio::dispatch(c->sock.get_executor(), [this, c]() {
        send_via(c, Message{"Welcome to echo server!"});
        do_read(c);
      });
    } else {
      Logger::instance().log(LogLevel::ERROR, "accept fail: %s",
                             ec.message().c_str());
    }
    do_accept();
  });
}

void EchoServer::do_read(std::shared_ptr<Conn> c) {
  c->sock.async_read_some(
      asio::buffer(c->read_buf), [this, c](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec == asio::error::eof)
            Logger::instance().log(LogLevel::INFO,
                                   "[%s] client disconnected (%zu bytes dangling)",
                                   c->peer.c_str(), c->decoder.buffered());
          else if (ec != asio::error::operation_aborted)
            Logger::instance().log(LogLevel::WARN, "[%s] read error: %s",
                                   c->peer.c_str(), ec.message().c_str());
          return;
        }
        handle_bytes(c, n);
        do_read(c);
      });
}

void EchoServer::handle_bytes(std::shared_ptr<Conn> c, size_t n) {
  c->decoder.push(c->read_buf.data(), n);
  while (auto ev = c->decoder.next()) {
    if (!ev->ok()) {
      Logger::instance().log(LogLevel::WARN, "[%s] frame error: %s",
                             c->peer.c_str(), ev->ec.message().c_str());
      continue;
    }
    Logger::instance().log(LogLevel::INFO, "[%s] received %s", c->peer.c_str(),
                           describe(ev->packet).c_str());
    send_via(c, reply_for(ev->packet));
  }
}

void EchoServer::do_write(std::shared_ptr<Conn> c) {
  if (c->write_q.empty())
    return;
  auto &front = c->write_q.front();
  asio::async_write(c->sock, asio::buffer(front),
                    [this, c](std::error_code ec, std::size_t) {
                      if (ec) {
                        Logger::instance().log(LogLevel::WARN,
                                               "[%s] write error: %s",
                                               c->peer.c_str(),
                                               ec.message().c_str());
                        return;
                      }
                      c->write_q.pop_front();
                      if (!c->write_q.empty())
                        do_write(c);
                    });
}

void EchoServer::send_via(std::shared_ptr<Conn> c, const Packet &p) {
  std::vector<uint8_t> buf;
  std::error_code ec;
  if (!encode(p, buf, ec)) {
    Logger::instance().log(LogLevel::ERROR, "[%s] encode %s failed: %s",
                           c->peer.c_str(), describe(p).c_str(),
                           ec.message().c_str());
    return;
  }
  c->write_q.emplace_back(std::move(buf));
  if (c->write_q.size() == 1)
    do_write(c);
}

} // namespace byteframe
