#pragma once
#include <cstddef>
#include <string>

#include "SecureBuffer.hpp"

inline constexpr int DEFAULT_ITERATIONS = 300000;
inline constexpr int DEFAULT_SALT_LEN   = 16;
inline constexpr int DEFAULT_HASH_LEN   = 32;

// Defaults used by PasswordHasher::hash(secret). Pass your own to the
// constructor to change them; nothing here is process-wide.
struct HashOptions {
    int iterations = DEFAULT_ITERATIONS;
    int saltBytes  = DEFAULT_SALT_LEN;
    int hashBytes  = DEFAULT_HASH_LEN;
};

// PBKDF2-HMAC-SHA256 password records:
//   pbkdf2_sha256$<iterations>$<salt-base64>$<hash-base64>
// Stateless apart from the options, so one instance can be shared across threads.
class PasswordHasher {
public:
    PasswordHasher() = default;
    explicit PasswordHasher(const HashOptions& options);

    // Hash with the configured options.
    std::string hash(const std::string& secret) const;

    // Create a new record from a plaintext secret (UTF-8):
    // - generates saltBytes random bytes
    // - PBKDF2-HMAC-SHA256 with `iterations` rounds -> hashBytes key
    // Throws std::invalid_argument for an empty/whitespace-only secret or a
    // non-positive parameter, std::runtime_error if RNG, KDF or allocation fails.
    std::string hash(const std::string& secret,
                     int iterations,
                     int saltBytes,
                     int hashBytes) const;

    // Re-derive with the iterations and salt embedded in the record and
    // compare in constant time. Malformed records, blank inputs and
    // backend faults all come back as false.
    bool verify(const std::string& secret, const std::string& record) const noexcept;

    const HashOptions& options() const { return m_options; }

    // Raw PKCS5_PBKDF2_HMAC(SHA-256). Throws std::runtime_error on failure.
    static SecureBuffer deriveKey(const std::string& secret,
                                  const SecureBuffer& salt,
                                  int iterations,
                                  std::size_t outLen);

private:
    HashOptions m_options;
};

// Empty, or nothing but Unicode whitespace once decoded as UTF-8 (tab..CR,
// space, NEL, NBSP, U+1680, U+2000..U+200A, U+2028/2029, U+202F, U+205F,
// U+3000). Malformed UTF-8 counts as content.
bool isBlank(const std::string& text);
