#pragma once
#include <cstdint>
#include <string>
#include "packet.hpp"

namespace byteframe {

struct ClientConfig {
    std::string server_host{"127.0.0.1"};
    uint16_t server_port{8080};
};

enum class CommandKind { SEND, QUIT, EMPTY, INVALID };

// One line of client input:
//   ping             -> Ping
//   data <hex bytes> -> Data
//   quit             -> QUIT
//   anything else    -> Message with the trimmed line
CommandKind parse_command(const std::string& line, Packet& out);

} // namespace byteframe
