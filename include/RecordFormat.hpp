#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "SecureBuffer.hpp"

// pbkdf2_sha256$<iterations>$<salt-base64>$<hash-base64>
inline constexpr char        RECORD_TAG[]          = "pbkdf2_sha256";
inline constexpr char        RECORD_PREFIX[]       = "pbkdf2_sha256$";
inline constexpr char        RECORD_SEPARATOR      = '$';
inline constexpr std::size_t MAX_ITERATION_DIGITS  = 10;

struct Pbkdf2Record {
    int          iterations = 0;
    SecureBuffer salt;
    SecureBuffer hash; // derived key
};

// Throws std::invalid_argument if iterations <= 0 or salt/hash is empty.
std::string formatRecord(int iterations,
                         const SecureBuffer& salt,
                         const SecureBuffer& hash);

// Strict parse: tag prefix, exactly four '$'-separated fields with none
// empty, iterations as 1..10 plain ASCII digits within 1..INT_MAX, and
// strict Base64 for salt and hash. Anything else -> nullopt, never throws
// on malformed text.
std::optional<Pbkdf2Record> parseRecord(const std::string& text);

// Plain decimal parse used for the iterations field. Exposed for the CLI.
std::optional<int> parsePositiveDecimal(const std::string& digits);
