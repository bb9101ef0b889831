#pragma once
#include <system_error>
#include <type_traits>

namespace byteframe {

// Per-frame protocol errors. None of them is fatal to a FrameDecoder.
enum class FrameError : int {
    INVALID_MAGIC = 1,
    UNKNOWN_OPCODE,
    MALFORMED_PACKET,
    PAYLOAD_TOO_LARGE,
    CHECKSUM_MISMATCH,
    INCOMPLETE_FRAME,
    DESYNCHRONIZED
};

const std::error_category& frame_category();

inline std::error_code make_error_code(FrameError e) {
    return std::error_code(static_cast<int>(e), frame_category());
}

} // namespace byteframe

namespace std {
template <>
struct is_error_code_enum<byteframe::FrameError> : true_type {};
} // namespace std
