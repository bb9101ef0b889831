#pragma once
#include <asio.hpp>
#include <system_error>
#include <vector>
#include "codec.hpp"
#include "frame_decoder.hpp"
#include "logging.hpp"

namespace byteframe {

// Blocking packet reader over any asio SyncReadStream.
template <typename SyncReadStream>
class PacketReader {
public:
    explicit PacketReader(SyncReadStream& stream, size_t capacity = 4096,
                          const DecoderConfig& cfg = DecoderConfig())
        : stream_(stream), read_buf_(capacity ? capacity : 1), decoder_(cfg) {}

    // Returns false with ec set on a frame error (the stream stays usable),
    // a transport error, or asio::error::eof at the end of the stream.
    bool read_packet(Packet& out, std::error_code& ec) {
        for (;;) {
            if (auto ev = decoder_.next()) {
                if (!ev->ok()) {
                    ec = ev->ec;
                    return false;
                }
                out = std::move(ev->packet);
                ec.clear();
                return true;
            }

            size_t n = stream_.read_some(asio::buffer(read_buf_), ec);
            if (!ec && n == 0)
                ec = asio::error::eof;
            if (ec) {
                if (ec == asio::error::eof && decoder_.buffered() > 0)
                    Logger::instance().log(LogLevel::WARN,
                                           "stream closed with %zu bytes of an unfinished frame",
                                           decoder_.buffered());
                return false;
            }
            decoder_.push(read_buf_.data(), n);
        }
    }

    Packet read_packet() {
        Packet p;
        std::error_code ec;
        if (!read_packet(p, ec))
            throw std::system_error(ec, "read_packet");
        return p;
    }

    FrameDecoder& decoder() { return decoder_; }
    SyncReadStream& next_layer() { return stream_; }

private:
    SyncReadStream& stream_;
    std::vector<uint8_t> read_buf_;
    FrameDecoder decoder_;
};

// Blocking packet writer over any asio SyncWriteStream. Each call writes one
// whole frame.
template <typename SyncWriteStream>
class PacketWriter {
public:
    explicit PacketWriter(SyncWriteStream& stream, size_t capacity = 1024)
        : stream_(stream) {
        encode_buf_.reserve(capacity);
    }

    bool write_packet(const Packet& p, std::error_code& ec) {
        encode_buf_.clear();
        if (!encode(p, encode_buf_, ec))
            return false;
        asio::write(stream_, asio::buffer(encode_buf_), ec);
        return !ec;
    }

    void write_packet(const Packet& p) {
        std::error_code ec;
        if (!write_packet(p, ec))
            throw std::system_error(ec, "write_packet");
    }

    SyncWriteStream& next_layer() { return stream_; }

private:
    SyncWriteStream& stream_;
    std::vector<uint8_t> encode_buf_;
};

} // namespace byteframe
