#pragma once
#include <climits>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <openssl/rand.h>

#include "SecureBuffer.hpp"

// Fill [out, out+len) from the OpenSSL CSPRNG. Throws on RNG failure.
inline void fill_random(std::uint8_t* out, std::size_t len) {
    // RAND_bytes takes an int length; feed large requests in chunks
    while (len > 0) {
        const int chunk = len > static_cast<std::size_t>(INT_MAX)
                              ? INT_MAX
                              : static_cast<int>(len);
        if (RAND_bytes(out, chunk) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        out += chunk;
        len -= static_cast<std::size_t>(chunk);
    }
}

inline void fill_random(SecureBuffer& buf) {
    fill_random(buf.data(), buf.size());
}

inline SecureBuffer random_bytes(std::size_t len) {
    SecureBuffer buf(len);
    fill_random(buf);
    return buf;
}
