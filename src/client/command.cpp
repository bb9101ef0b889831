#include "command.hpp"
#include "util.hpp"

namespace byteframe {

static std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return std::string();
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

CommandKind parse_command(const std::string &line, Packet &out) {
  std::string t = trim(line);
  if (t.empty())
    return CommandKind::EMPTY;
  if (t == "quit")
    return CommandKind::QUIT;
  if (t == "ping") {
    out = Ping{};
    return CommandKind::SEND;
  }
  if (t.compare(0, 5, "data ") == 0) {
    std::vector<uint8_t> bytes;
    if (!hex_to_bytes(t.substr(5), bytes))
      return CommandKind::INVALID;
    out = Data{std::move(bytes)};
    return CommandKind::SEND;
  }
  out = Message{t};
  return CommandKind::SEND;
}

} // namespace byteframe
