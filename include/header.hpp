#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <system_error>

namespace byteframe {

constexpr uint16_t kMagic = 0xAA55;
constexpr size_t   kHeaderLen = 9;
constexpr size_t   kMagicLen = 2;

// Wire layout, big-endian, no padding:
//   [magic:2][opcode:1][length:2][checksum:4]
struct Header {
    uint16_t magic{kMagic};
    uint8_t  opcode{0};
    uint16_t length{0};
    uint32_t checksum{0};
};

using HeaderBytes = std::array<uint8_t, kHeaderLen>;

HeaderBytes serialize(const Header& hdr);
void serialize(const Header& hdr, uint8_t* out);

// Parses kHeaderLen bytes at data. Only the magic is validated; opcode and
// checksum are left to the codec and the decoder.
bool deserialize(const uint8_t* data, size_t len, Header& out, std::error_code& ec);

// Unpacks kHeaderLen bytes at data without any validation.
Header unpack(const uint8_t* data);

inline bool is_magic(const uint8_t* data) {
    return data[0] == (kMagic >> 8) && data[1] == (kMagic & 0xFF);
}

} // namespace byteframe
