#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Owning byte buffer for secret-derived material (salts, derived keys,
// decoded hashes). Storage comes from OPENSSL_zalloc and goes back through
// OPENSSL_clear_free, so destructor, clear(), resize() and move-assignment
// all wipe first. Allocation failure throws std::runtime_error.
// Copying is disabled so key bytes never get duplicated behind our back.
class SecureBuffer {
public:
    SecureBuffer() = default;
    explicit SecureBuffer(std::size_t size);
    SecureBuffer(const std::uint8_t* bytes, std::size_t size);
    ~SecureBuffer() = default;

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept;
    SecureBuffer& operator=(SecureBuffer&& other) noexcept;

    std::uint8_t*       data()       { return m_data.get(); }
    const std::uint8_t* data() const { return m_data.get(); }
    std::size_t size() const  { return m_size; }
    bool        empty() const { return m_size == 0; }

    std::uint8_t*       begin()       { return data(); }
    std::uint8_t*       end()         { return data() + m_size; }
    const std::uint8_t* begin() const { return data(); }
    const std::uint8_t* end()   const { return data() + m_size; }

    std::uint8_t&       operator[](std::size_t i)       { return data()[i]; }
    const std::uint8_t& operator[](std::size_t i) const { return data()[i]; }

    // Shrinking wipes the dropped tail; growing moves into fresh storage
    // and wipes the old block. New bytes are zero.
    void resize(std::size_t newSize);

    // Wipe and release. The buffer is empty afterwards.
    void clear();

private:
    // Frees the whole allocated block, which may be larger than m_size
    // after a shrinking resize().
    struct ClearFree {
        ClearFree() noexcept {}
        ClearFree(std::size_t n) noexcept : allocated(n) {}
        std::size_t allocated = 0;
        void operator()(std::uint8_t* p) const;
    };

    std::unique_ptr<std::uint8_t, ClearFree> m_data;
    std::size_t m_size = 0;
};

// Fixed-time equality. Unequal lengths return false straight away: the
// length of a stored hash is public, its content is not.
bool constTimeEqual(const SecureBuffer& a, const SecureBuffer& b);
bool constTimeEqual(const std::uint8_t* a, std::size_t aLen,
                    const std::uint8_t* b, std::size_t bLen);

// Overwrite a caller-owned string (e.g. a password read from the console)
// and leave it empty.
void secureWipe(std::string& text);
