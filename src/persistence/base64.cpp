#include "persistence/base64.hpp"

#include "common/errors.hpp"

#include <limits>
#include <stdexcept>

#include <openssl/evp.h>

namespace cstate::persistence {

std::string base64_encode(ByteView data) {
    if (data.empty()) {
        return {};
    }
    if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
        throw std::length_error("base64_encode: input too large");
    }

    // EVP_EncodeBlock writes a trailing NUL.
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

Bytes base64_decode(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw MalformedStateError("base64 length is not a multiple of 4");
    }
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw MalformedStateError("base64 input too large");
    }

    // EVP_DecodeBlock reads '=' as zero anywhere, so padding is checked here:
    // at most two, only in the final positions.
    const auto pad_start = text.find('=');
    if (pad_start != std::string_view::npos) {
        const std::size_t pad = text.size() - pad_start;
        if (pad > 2 || text.find_first_not_of('=', pad_start) != std::string_view::npos) {
            throw MalformedStateError("invalid base64 padding");
        }
    }

    Bytes out(text.size() / 4 * 3);
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (n < 0) {
        throw MalformedStateError("invalid base64");
    }

    // EVP_DecodeBlock counts padding as zero bytes; trim them.
    std::size_t len = static_cast<std::size_t>(n);
    if (text.back() == '=') --len;
    if (text[text.size() - 2] == '=') --len;
    out.resize(len);
    return out;
}

} // namespace cstate::persistence
