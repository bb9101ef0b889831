#include "codec.hpp"
#include <algorithm>
#include "checksum.hpp"
#include "error.hpp"

namespace byteframe {

namespace {

// Pointer/length view of a packet's payload; no copy.
struct PayloadView {
  const uint8_t *data;
  size_t len;
};

PayloadView payload_of(const Packet &p) {
  if (auto m = std::get_if<Message>(&p))
    return {reinterpret_cast<const uint8_t *>(m->text.data()), m->text.size()};
  if (auto d = std::get_if<Data>(&p))
    return {d->bytes.data(), d->bytes.size()};
  return {nullptr, 0};
}

std::optional<Packet> packet_from_opcode(uint8_t opcode, const uint8_t *payload,
                                         size_t len, std::error_code &ec) {
  switch (static_cast<Opcode>(opcode)) {
  case Opcode::PING:
    if (len != 0) {
      ec = FrameError::MALFORMED_PACKET;
      return std::nullopt;
    }
    return Packet{Ping{}};
  case Opcode::PONG:
    if (len != 0) {
      ec = FrameError::MALFORMED_PACKET;
      return std::nullopt;
    }
    return Packet{Pong{}};
  case Opcode::MESSAGE:
    return Packet{Message{std::string(reinterpret_cast<const char *>(payload), len)}};
  case Opcode::DATA:
    return Packet{Data{std::vector<uint8_t>(payload, payload + len)}};
  }
  ec = FrameError::UNKNOWN_OPCODE;
  return std::nullopt;
}

} // namespace

bool encode(const Packet &p, std::vector<uint8_t> &out, std::error_code &ec) {
  PayloadView pv = payload_of(p);
  if (pv.len > kMaxPayloadLen) {
    ec = FrameError::PAYLOAD_TOO_LARGE;
    return false;
  }
  Header hdr;
  hdr.opcode = static_cast<uint8_t>(opcode_of(p));
  hdr.length = static_cast<uint16_t>(pv.len);
  hdr.checksum = fnv1a32(pv.data, pv.len);

  size_t off = out.size();
  out.resize(off + kHeaderLen + pv.len);
  serialize(hdr, out.data() + off);
  if (pv.len)
    std::copy(pv.data, pv.data + pv.len, out.begin() + off + kHeaderLen);
  ec.clear();
  return true;
}

std::vector<uint8_t> encode(const Packet &p) {
  std::vector<uint8_t> out;
  std::error_code ec;
  if (!encode(p, out, ec))
    throw std::system_error(ec, "encode");
  return out;
}

std::optional<Packet> decode(const uint8_t *data, size_t len,
                             std::error_code &ec, size_t max_payload) {
  Header hdr;
  if (!deserialize(data, len, hdr, ec))
    return std::nullopt;
  if (hdr.length > max_payload) {
    ec = FrameError::PAYLOAD_TOO_LARGE;
    return std::nullopt;
  }
  if (len - kHeaderLen < hdr.length) {
    ec = FrameError::INCOMPLETE_FRAME;
    return std::nullopt;
  }
  return decode_frame(hdr, data + kHeaderLen, hdr.length, ec);
}

std::optional<Packet> decode_frame(const Header &hdr, const uint8_t *payload,
                                   size_t len, std::error_code &ec) {
  if (len != hdr.length) {
    ec = FrameError::INCOMPLETE_FRAME;
    return std::nullopt;
  }
  if (fnv1a32(payload, len) != hdr.checksum) {
    ec = FrameError::CHECKSUM_MISMATCH;
    return std::nullopt;
  }
  ec.clear();
  return packet_from_opcode(hdr.opcode, payload, len, ec);
}

} // namespace byteframe
