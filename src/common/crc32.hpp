#pragma once

#include <cstddef>
#include <cstdint>

namespace cstate {

// CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
// `seed` continues a previous computation: crc32(b, n2, crc32(a, n1)).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length,
                             uint32_t seed = 0);

} // namespace cstate
