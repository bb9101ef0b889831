#pragma once
#include <algorithm>
#include <cstdint>
#include <vector>
#include "codec.hpp"
#include "frame_decoder.hpp"
#include "logging.hpp"

// Quiet the decoder's resync warnings unless a test asks otherwise.
inline void setup_test_environment() {
    byteframe::Logger::instance().set_level(byteframe::LogLevel::ERROR);
}

inline std::vector<uint8_t> encode_all(const std::vector<byteframe::Packet>& packets) {
    std::vector<uint8_t> out;
    for (const auto& p : packets) {
        std::error_code ec;
        byteframe::encode(p, out, ec);
    }
    return out;
}

// Pushes bytes chunk_size at a time, polling after every push.
inline std::vector<byteframe::DecodeEvent>
feed_in_chunks(byteframe::FrameDecoder& dec, const std::vector<uint8_t>& bytes, size_t chunk_size) {
    std::vector<byteframe::DecodeEvent> events;
    for (size_t off = 0; off < bytes.size(); off += chunk_size) {
        size_t n = std::min(chunk_size, bytes.size() - off);
        dec.push(bytes.data() + off, n);
        dec.poll(events);
    }
    return events;
}

inline std::vector<byteframe::Packet> packets_of(const std::vector<byteframe::DecodeEvent>& events) {
    std::vector<byteframe::Packet> out;
    for (const auto& ev : events)
        if (ev.ok())
            out.push_back(ev.packet);
    return out;
}

inline byteframe::Data data_of(size_t n, uint8_t seed = 0) {
    byteframe::Data d;
    d.bytes.resize(n);
    for (size_t i = 0; i < n; i++)
        d.bytes[i] = static_cast<uint8_t>(seed + i * 7);
    return d;
}
