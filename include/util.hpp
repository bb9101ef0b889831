#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace byteframe {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

// Accepts "0102ff" as well as whitespace separated tokens ("01 02 ff").
// Returns false and leaves out untouched on a malformed token.
bool hex_to_bytes(const std::string& hex, std::vector<uint8_t>& out);
std::string bytes_to_hex(const uint8_t* data, size_t len);

// Network byte order helpers.
inline void put_u16_be(uint8_t* out, uint16_t v) {
    out[0] = static_cast<uint8_t>((v >> 8) & 0xFF);
    out[1] = static_cast<uint8_t>(v & 0xFF);
}

inline void put_u32_be(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(v & 0xFF);
}

inline uint16_t get_u16_be(const uint8_t* in) {
    return static_cast<uint16_t>((static_cast<uint16_t>(in[0]) << 8) | in[1]);
}

inline uint32_t get_u32_be(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

} // namespace byteframe
