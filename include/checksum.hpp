#pragma once
#include <cstdint>
#include <cstddef>

namespace byteframe {

constexpr uint32_t kFnvOffsetBasis = 0x811C9DC5u;
constexpr uint32_t kFnvPrime = 0x01000193u;

// FNV-1a 32-bit. Corruption detector only, not a digest.
uint32_t fnv1a32(const uint8_t* data, size_t len);

} // namespace byteframe
