#include "header.hpp"
#include "error.hpp"
#include "util.hpp"

namespace byteframe {

void serialize(const Header &hdr, uint8_t *out) {
  put_u16_be(out + 0, hdr.magic);
  out[2] = hdr.opcode;
  put_u16_be(out + 3, hdr.length);
  put_u32_be(out + 5, hdr.checksum);
}

HeaderBytes serialize(const Header &hdr) {
  HeaderBytes bytes{};
  serialize(hdr, bytes.data());
  return bytes;
}

bool deserialize(const uint8_t *data, size_t len, Header &out,
                 std::error_code &ec) {
  if (len < kHeaderLen) {
    ec = FrameError::INCOMPLETE_FRAME;
    return false;
  }
  uint16_t magic = get_u16_be(data);
  if (magic != kMagic) {
    ec = FrameError::INVALID_MAGIC;
    return false;
  }
  out = unpack(data);
  ec.clear();
  return true;
}

Header unpack(const uint8_t *data) {
  Header h;
  h.magic = get_u16_be(data);
  h.opcode = data[2];
  h.length = get_u16_be(data + 3);
  h.checksum = get_u32_be(data + 5);
  return h;
}

} // namespace byteframe
