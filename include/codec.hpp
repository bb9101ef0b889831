#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <system_error>
#include <vector>
#include "header.hpp"
#include "packet.hpp"

namespace byteframe {

// Largest payload the 16-bit length field can describe.
constexpr size_t kMaxPayloadLen = 0xFFFF;

// Appends one complete frame to out. On PAYLOAD_TOO_LARGE out is untouched.
bool encode(const Packet& p, std::vector<uint8_t>& out, std::error_code& ec);

// Throws std::system_error on failure.
std::vector<uint8_t> encode(const Packet& p);

// Decodes a single, already-delimited frame. Stateless; no resynchronization.
std::optional<Packet> decode(const uint8_t* data, size_t len, std::error_code& ec,
                             size_t max_payload = kMaxPayloadLen);

inline std::optional<Packet> decode(const std::vector<uint8_t>& frame, std::error_code& ec) {
    return decode(frame.data(), frame.size(), ec);
}

// Verifies the checksum and maps opcode+payload to a Packet. payload must hold
// exactly hdr.length bytes.
std::optional<Packet> decode_frame(const Header& hdr, const uint8_t* payload, size_t len,
                                   std::error_code& ec);

} // namespace byteframe
