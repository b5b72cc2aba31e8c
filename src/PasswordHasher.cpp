#include "PasswordHasher.hpp"
#include "RecordFormat.hpp"
#include "secure_random.hpp"

#include <openssl/evp.h>    // PKCS5_PBKDF2_HMAC, EVP_sha256
#include <climits>
#include <exception>
#include <new>
#include <stdexcept>

PasswordHasher::PasswordHasher(const HashOptions& options)
    : m_options(options)
{
}

std::string PasswordHasher::hash(const std::string& secret) const {
    return hash(secret, m_options.iterations, m_options.saltBytes, m_options.hashBytes);
}

std::string PasswordHasher::hash(const std::string& secret,
                                 int iterations,
                                 int saltBytes,
                                 int hashBytes) const {
    if (isBlank(secret)) {
        throw std::invalid_argument("hash: secret must not be empty or whitespace");
    }
    if (iterations <= 0) throw std::invalid_argument("hash: iterations must be positive");
    if (saltBytes  <= 0) throw std::invalid_argument("hash: saltBytes must be positive");
    if (hashBytes  <= 0) throw std::invalid_argument("hash: hashBytes must be positive");

    try {
        // 1) Random salt
        SecureBuffer salt = random_bytes(static_cast<std::size_t>(saltBytes));

        // 2) PBKDF2 straight from the caller's UTF-8 bytes; the key is wiped
        //    when `key` goes out of scope, on the throw path as well
        SecureBuffer key = deriveKey(secret, salt, iterations, static_cast<std::size_t>(hashBytes));

        return formatRecord(iterations, salt, key);
    } catch (const std::bad_alloc&) {
        throw std::runtime_error("hash: out of memory for requested salt/hash size");
    }
}

bool PasswordHasher::verify(const std::string& secret, const std::string& record) const noexcept {
    if (isBlank(secret) || isBlank(record)) {
        return false;
    }

    try {
        auto parsed = parseRecord(record);
        if (!parsed) return false;

        SecureBuffer candidate = deriveKey(secret, parsed->salt, parsed->iterations,
                                           parsed->hash.size());
        return constTimeEqual(candidate, parsed->hash);
    } catch (const std::exception&) {
        // KDF failure or allocation failure: same answer as a wrong password
        return false;
    }
}

SecureBuffer PasswordHasher::deriveKey(const std::string& secret,
                                       const SecureBuffer& salt,
                                       int iterations,
                                       std::size_t outLen) {
    if (iterations <= 0) {
        throw std::invalid_argument("deriveKey: iterations must be positive");
    }
    if (secret.size() > static_cast<std::size_t>(INT_MAX) ||
        salt.size()   > static_cast<std::size_t>(INT_MAX) ||
        outLen        > static_cast<std::size_t>(INT_MAX)) {
        throw std::runtime_error("deriveKey: input too large for PKCS5_PBKDF2_HMAC");
    }

    SecureBuffer key(outLen);
    int rc = PKCS5_PBKDF2_HMAC(
        secret.data(), static_cast<int>(secret.size()),
        salt.data(),   static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        static_cast<int>(key.size()),
        key.data()
    );
    if (rc != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return key;
}

namespace {
    // Decode one UTF-8 sequence at text[i], advancing i. Returns -1 for a
    // malformed or truncated sequence.
    long next_code_point(const std::string& text, std::size_t& i) {
        const auto lead = static_cast<unsigned char>(text[i++]);
        if (lead < 0x80) return lead;

        int extra;
        long cp;
        if      ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }
        else return -1;

        for (int k = 0; k < extra; ++k) {
            if (i >= text.size()) return -1;
            const auto cont = static_cast<unsigned char>(text[i++]);
            if ((cont & 0xC0) != 0x80) return -1;
            cp = (cp << 6) | (cont & 0x3F);
        }
        static const long kMinForLength[] = { 0, 0x80, 0x800, 0x10000 };
        if (cp < kMinForLength[extra]) return -1; // overlong
        return cp;
    }

    // Unicode White_Space (Zs, Zl, Zp plus the C0/C1 controls U+0009-000D, U+0085)
    bool is_unicode_space(long cp) {
        switch (cp) {
            case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
            case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
            case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
                return true;
            default:
                return cp >= 0x2000 && cp <= 0x200A;
        }
    }
}

bool isBlank(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_unicode_space(next_code_point(text, i))) return false;
    }
    return true;
}
