#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "SecureBuffer.hpp"

// Standard RFC 4648 Base64 (A-Z a-z 0-9 + /, '=' padding, no line breaks).
std::string base64Encode(const std::uint8_t* bytes, std::size_t len);
std::string base64Encode(const SecureBuffer& buf);

// Strict decode. Returns nullopt for empty input, a length that is not a
// multiple of 4, any character outside the alphabet (whitespace and the
// URL-safe '-' / '_' included), or misplaced / excess '=' padding.
std::optional<SecureBuffer> base64Decode(const std::string& text);
