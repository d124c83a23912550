#pragma once

#include "common/bytes.hpp"

#include <string>
#include <string_view>

namespace cstate::persistence {

// Standard base64 (RFC 4648, padded) via OpenSSL's EVP block coders.

[[nodiscard]] std::string base64_encode(ByteView data);

// Throws MalformedStateError if `text` is not valid padded base64.
[[nodiscard]] Bytes base64_decode(std::string_view text);

} // namespace cstate::persistence
