#include "RecordFormat.hpp"
#include "Base64.hpp"

#include <climits>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {
    // Split on every separator, keeping empty fields, so "a$$b" is three fields.
    std::vector<std::string> split_fields(const std::string& text, char sep) {
        std::vector<std::string> fields;
        std::size_t start = 0;
        for (;;) {
            std::size_t pos = text.find(sep, start);
            if (pos == std::string::npos) {
                fields.emplace_back(text, start);
                break;
            }
            fields.emplace_back(text, start, pos - start);
            start = pos + 1;
        }
        return fields;
    }
}

std::string formatRecord(int iterations,
                         const SecureBuffer& salt,
                         const SecureBuffer& hash) {
    if (iterations <= 0) {
        throw std::invalid_argument("formatRecord: iterations must be positive");
    }
    if (salt.empty() || hash.empty()) {
        throw std::invalid_argument("formatRecord: salt and hash must not be empty");
    }

    const std::string iter   = std::to_string(iterations);
    const std::string saltB64 = base64Encode(salt);
    const std::string hashB64 = base64Encode(hash);

    std::string out;
    out.reserve(std::strlen(RECORD_PREFIX) + iter.size() + 1 +
                saltB64.size() + 1 + hashB64.size());
    out += RECORD_PREFIX;
    out += iter;
    out += RECORD_SEPARATOR;
    out += saltB64;
    out += RECORD_SEPARATOR;
    out += hashB64;
    return out;
}

std::optional<int> parsePositiveDecimal(const std::string& digits) {
    if (digits.empty() || digits.size() > MAX_ITERATION_DIGITS) return std::nullopt;

    long long value = 0; // 10 digits always fit
    for (char ch : digits) {
        if (ch < '0' || ch > '9') return std::nullopt;
        value = value * 10 + (ch - '0');
    }
    if (value <= 0 || value > INT_MAX) return std::nullopt;
    return static_cast<int>(value);
}

std::optional<Pbkdf2Record> parseRecord(const std::string& text) {
    const std::size_t prefixLen = std::strlen(RECORD_PREFIX);
    if (text.size() <= prefixLen || text.compare(0, prefixLen, RECORD_PREFIX) != 0) {
        return std::nullopt;
    }

    auto fields = split_fields(text, RECORD_SEPARATOR);
    if (fields.size() != 4 || fields[0] != RECORD_TAG) return std::nullopt;
    for (const auto& f : fields) {
        if (f.empty()) return std::nullopt;
    }

    auto iterations = parsePositiveDecimal(fields[1]);
    if (!iterations) return std::nullopt;

    auto salt = base64Decode(fields[2]);
    if (!salt) return std::nullopt;

    auto hash = base64Decode(fields[3]);
    if (!hash) return std::nullopt;

    std::optional<Pbkdf2Record> rec(std::in_place);
    rec->iterations = *iterations;
    rec->salt = std::move(*salt);
    rec->hash = std::move(*hash);
    return rec;
}
