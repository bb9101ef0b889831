#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include "frame_decoder.hpp"
#include "packet.hpp"

namespace byteframe {

struct ServerConfig {
    std::string listen_host{"127.0.0.1"};
    uint16_t listen_port{8080};
    int threads{2};
    DecoderConfig decoder;
};

class EchoServer {
public:
    using tcp = asio::ip::tcp;

    struct Conn : public std::enable_shared_from_this<Conn> {
        tcp::socket sock;
        std::string peer;
        std::vector<uint8_t> read_buf;
        std::deque<std::vector<uint8_t>> write_q;
        FrameDecoder decoder;
        Conn(asio::io_context& io, const DecoderConfig& cfg)
            : sock(asio::make_strand(io)), read_buf(64*1024), decoder(cfg) {}
    };

    EchoServer(asio::io_context& io, const ServerConfig& cfg);
    void start();
    void stop();
    uint16_t local_port() const;

    // Reply for one decoded packet: Ping gets Pong, everything else is echoed.
    static Packet reply_for(const Packet& p);

private:
    asio::io_context& io_;
    ServerConfig cfg_;
    tcp::acceptor acceptor_;

    void do_accept();
    void do_read(std::shared_ptr<Conn> c);
    void do_write(std::shared_ptr<Conn> c);
    void handle_bytes(std::shared_ptr<Conn> c, size_t n);
    void send_via(std::shared_ptr<Conn> c, const Packet& p);
};

} // namespace byteframe
