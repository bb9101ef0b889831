#include "util.hpp"
#include <cctype>
#include <cstdio>

namespace byteframe {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  host = s.substr(0, pos);
  try {
    size_t used = 0;
    int p = std::stoi(s.substr(pos + 1), &used);
    if (used != s.size() - pos - 1)
      return false;
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool hex_to_bytes(const std::string &hex, std::vector<uint8_t> &out) {
  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  size_t i = 0;
  while (i < hex.size()) {
    if (std::isspace((unsigned char)hex[i])) {
      i++;
      continue;
    }
    // a token is one or two digits, then whitespace or the next pair
    int hi = hex_value(hex[i]);
    if (hi < 0)
      return false;
    int lo = (i + 1 < hex.size()) ? hex_value(hex[i + 1]) : -1;
    if (lo < 0) {
      if (i + 1 < hex.size() && !std::isspace((unsigned char)hex[i + 1]))
        return false;
      bytes.push_back((uint8_t)hi);
      i += 1;
    } else {
      bytes.push_back((uint8_t)((hi << 4) | lo));
      i += 2;
    }
  }
  out.swap(bytes);
  return true;
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  std::string out;
  out.reserve(len * 3);
  char tmp[4];
  for (size_t i = 0; i < len; i++) {
    std::snprintf(tmp, sizeof(tmp), i == 0 ? "%02x" : " %02x", data[i]);
    out += tmp;
  }
  return out;
}

} // namespace byteframe
