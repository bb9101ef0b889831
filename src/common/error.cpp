#include "error.hpp"
#include <string>

namespace byteframe {

namespace {

class FrameCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "byteframe"; }

  std::string message(int ev) const override {
    switch (static_cast<FrameError>(ev)) {
    case FrameError::INVALID_MAGIC:
      return "invalid header magic";
    case FrameError::UNKNOWN_OPCODE:
      return "unknown opcode";
    case FrameError::MALFORMED_PACKET:
      return "malformed packet";
    case FrameError::PAYLOAD_TOO_LARGE:
      return "payload too large";
    case FrameError::CHECKSUM_MISMATCH:
      return "checksum mismatch";
    case FrameError::INCOMPLETE_FRAME:
      return "incomplete frame";
    case FrameError::DESYNCHRONIZED:
      return "stream desynchronized";
    }
    return "unknown byteframe error";
  }

  std::error_condition default_error_condition(int ev) const noexcept override {
    if (static_cast<FrameError>(ev) == FrameError::PAYLOAD_TOO_LARGE)
      return std::errc::message_size;
    return std::errc::protocol_error;
  }
};

} // namespace

const std::error_category &frame_category() {
  static FrameCategory inst;
  return inst;
}

} // namespace byteframe
