#include "Base64.hpp"

#include <openssl/evp.h> // EVP_EncodeBlock, EVP_DecodeBlock
#include <climits>
#include <stdexcept>

namespace {
    inline bool is_b64_char(char ch) {
        return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
               (ch >= '0' && ch <= '9') || ch == '+' || ch == '/';
    }
}

std::string base64Encode(const std::uint8_t* bytes, std::size_t len) {
    if (len == 0) return {};
    // EVP_EncodeBlock takes an int length
    if (len > static_cast<std::size_t>(INT_MAX / 4 * 3)) {
        throw std::invalid_argument("base64Encode: input too large");
    }

    // 4 chars per 3-byte group, plus the NUL EVP_EncodeBlock writes
    std::string out(((len + 2) / 3) * 4 + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            bytes, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::string base64Encode(const SecureBuffer& buf) {
    return base64Encode(buf.data(), buf.size());
}

std::optional<SecureBuffer> base64Decode(const std::string& text) {
    const std::size_t n = text.size();
    if (n == 0 || n % 4 != 0) return std::nullopt;
    if (n > static_cast<std::size_t>(INT_MAX)) return std::nullopt;

    // Padding: at most two '=', only at the very end
    std::size_t pad = 0;
    if (text[n - 1] == '=') {
        pad = 1;
        if (text[n - 2] == '=') pad = 2;
    }
    for (std::size_t i = 0; i < n - pad; ++i) {
        if (!is_b64_char(text[i])) return std::nullopt;
    }

    // EVP_DecodeBlock emits full 3-byte groups (padding decodes as zeros),
    // so size the buffer for that and trim afterwards.
    SecureBuffer out(n / 4 * 3);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(n));
    if (written < 0 || static_cast<std::size_t>(written) != out.size()) {
        return std::nullopt;
    }
    out.resize(out.size() - pad);
    return out;
}
