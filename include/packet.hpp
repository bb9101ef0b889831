#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace byteframe {

enum class Opcode : uint8_t {
    PING    = 0x01,
    PONG    = 0x02,
    MESSAGE = 0x03,
    DATA    = 0x04
};

struct Ping {};
struct Pong {};

// Text by convention; bytes are carried as-is, no UTF-8 validation.
struct Message {
    std::string text;
};

struct Data {
    std::vector<uint8_t> bytes;
};

inline bool operator==(const Ping&, const Ping&) { return true; }
inline bool operator==(const Pong&, const Pong&) { return true; }
inline bool operator==(const Message& a, const Message& b) { return a.text == b.text; }
inline bool operator==(const Data& a, const Data& b) { return a.bytes == b.bytes; }
inline bool operator!=(const Ping& a, const Ping& b) { return !(a == b); }
inline bool operator!=(const Pong& a, const Pong& b) { return !(a == b); }
inline bool operator!=(const Message& a, const Message& b) { return !(a == b); }
inline bool operator!=(const Data& a, const Data& b) { return !(a == b); }

// Closed set: one alternative per opcode.
using Packet = std::variant<Ping, Pong, Message, Data>;

Opcode opcode_of(const Packet& p);
size_t payload_size(const Packet& p);
std::string describe(const Packet& p);

} // namespace byteframe
