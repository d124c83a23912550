#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cstate {

// Owned byte sequence.
using Bytes = std::vector<uint8_t>;

// Read-only view over bytes owned elsewhere.
using ByteView = std::span<const uint8_t>;

inline ByteView as_bytes(std::string_view s) noexcept {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

inline std::string_view as_string_view(ByteView b) noexcept {
    return {reinterpret_cast<const char*>(b.data()), b.size()};
}

inline Bytes to_bytes(std::string_view s) {
    auto v = as_bytes(s);
    return Bytes(v.begin(), v.end());
}

} // namespace cstate
