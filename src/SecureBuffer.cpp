#include "SecureBuffer.hpp"

#include <openssl/crypto.h> // OPENSSL_zalloc, OPENSSL_clear_free, OPENSSL_cleanse, CRYPTO_memcmp
#include <cstring>
#include <stdexcept>
#include <utility>

void SecureBuffer::ClearFree::operator()(std::uint8_t* p) const {
    OPENSSL_clear_free(p, allocated);
}

SecureBuffer::SecureBuffer(std::size_t size)
    : m_data(nullptr, ClearFree{ size }), m_size(size)
{
    if (size == 0) return;
    void* raw = OPENSSL_zalloc(size);
    if (!raw) throw std::runtime_error("OPENSSL_zalloc failed");
    m_data.reset(static_cast<std::uint8_t*>(raw));
}

SecureBuffer::SecureBuffer(const std::uint8_t* bytes, std::size_t size)
    : SecureBuffer(size)
{
    if (size) std::memcpy(data(), bytes, size);
}

SecureBuffer::SecureBuffer(SecureBuffer&& other) noexcept
    : m_data(std::move(other.m_data)), m_size(std::exchange(other.m_size, 0))
{
}

SecureBuffer& SecureBuffer::operator=(SecureBuffer&& other) noexcept {
    if (this != &other) {
        m_data = std::move(other.m_data); // clear-frees our old block
        m_size = std::exchange(other.m_size, 0);
    }
    return *this;
}

void SecureBuffer::resize(std::size_t newSize) {
    if (newSize == m_size) return;
    if (newSize == 0) {
        clear();
        return;
    }
    if (newSize < m_size) {
        // keep the block, scrub what falls off the end
        OPENSSL_cleanse(data() + newSize, m_size - newSize);
        m_size = newSize;
        return;
    }

    SecureBuffer grown(newSize);
    if (m_size) std::memcpy(grown.data(), data(), m_size);
    *this = std::move(grown); // wipes the old block
}

void SecureBuffer::clear() {
    m_data.reset();
    m_size = 0;
}

bool constTimeEqual(const SecureBuffer& a, const SecureBuffer& b) {
    return constTimeEqual(a.data(), a.size(), b.data(), b.size());
}

bool constTimeEqual(const std::uint8_t* a, std::size_t aLen,
                    const std::uint8_t* b, std::size_t bLen) {
    if (aLen != bLen) return false;
    if (aLen == 0) return true;
    return CRYPTO_memcmp(a, b, aLen) == 0;
}

void secureWipe(std::string& text) {
    // Grow into the existing capacity (no reallocation) so stale bytes past
    // size() are scrubbed too.
    text.resize(text.capacity());
    if (!text.empty()) OPENSSL_cleanse(&text[0], text.size());
    text.clear();
}
