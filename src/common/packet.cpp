#include "packet.hpp"
#include "util.hpp"

namespace byteframe {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Opcode opcode_of(const Packet &p) {
  return std::visit(overloaded{
                        [](const Ping &) { return Opcode::PING; },
                        [](const Pong &) { return Opcode::PONG; },
                        [](const Message &) { return Opcode::MESSAGE; },
                        [](const Data &) { return Opcode::DATA; },
                    },
                    p);
}

size_t payload_size(const Packet &p) {
  return std::visit(overloaded{
                        [](const Ping &) -> size_t { return 0; },
                        [](const Pong &) -> size_t { return 0; },
                        [](const Message &m) { return m.text.size(); },
                        [](const Data &d) { return d.bytes.size(); },
                    },
                    p);
}

std::string describe(const Packet &p) {
  return std::visit(
      overloaded{
          [](const Ping &) { return std::string("Ping"); },
          [](const Pong &) { return std::string("Pong"); },
          [](const Message &m) { return "Message(\"" + m.text + "\")"; },
          [](const Data &d) {
            return "Data[" + bytes_to_hex(d.bytes.data(), d.bytes.size()) +
                   "]";
          },
      },
      p);
}

} // namespace byteframe
