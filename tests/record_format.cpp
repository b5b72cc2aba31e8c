// tests/record_format.cpp
#include <catch2/catch.hpp>
#include "PasswordHasher.hpp"
#include "RecordFormat.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    // Split on '$' keeping empty fields, rebuild with join()
    std::vector<std::string> fields_of(const std::string& record) {
        std::vector<std::string> out;
        std::size_t start = 0, pos;
        while ((pos = record.find('$', start)) != std::string::npos) {
            out.push_back(record.substr(start, pos - start));
            start = pos + 1;
        }
        out.push_back(record.substr(start));
        return out;
    }

    std::string join(const std::vector<std::string>& parts) {
        std::string out;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i) out += '$';
            out += parts[i];
        }
        return out;
    }

    // PBKDF2-HMAC-SHA256("password", "salt", 4096, 32)
    const std::string kKnownRecord =
        "pbkdf2_sha256$4096$c2FsdA==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=";
}

TEST_CASE("Record: hand-built known-answer records verify", "[format][kat]") {
    PasswordHasher hasher;

    REQUIRE(hasher.verify("password", kKnownRecord));
    REQUIRE_FALSE(hasher.verify("passwore", kKnownRecord));

    // c=1 and c=2 vectors
    REQUIRE(hasher.verify("password",
        "pbkdf2_sha256$1$c2FsdA==$Eg+2z/z4syxD5yJSVsT4N6hlSMkszDVICAWYfLcL4Xs="));
    REQUIRE(hasher.verify("password",
        "pbkdf2_sha256$2$c2FsdA==$rk0Mla9rRtMtCt/5KPBt0CowP47zwlHf1uLYWpVHTEM="));

    // 64-byte output: derived length follows the stored hash length
    REQUIRE(hasher.verify("passwd",
        "pbkdf2_sha256$1$c2FsdA==$VawEblbjCJ/sFpHCJUS2BflBhSFt3gRl5oudV8INrLxJypzM8Xm2RZkWZLOdd+8xfHG4RbHjC9UJESBB06GXgw=="));

    // Leading zeros in the iteration field are plain decimal
    REQUIRE(hasher.verify("password",
        "pbkdf2_sha256$0002$c2FsdA==$rk0Mla9rRtMtCt/5KPBt0CowP47zwlHf1uLYWpVHTEM="));

    // UTF-8 secret, 16-byte salt 00..0f, 1000 rounds
    REQUIRE(hasher.verify("p\xC3\xA4ssw\xC3\xB6rd \xF0\x9F\x9A\x80",
        "pbkdf2_sha256$1000$AAECAwQFBgcICQoLDA0ODw==$r+gi7DsmwAmgKUo/Nm10UCpEZqL4SFDWT0f/zaCFcd8="));
}

TEST_CASE("Record: formatRecord lays out tag, count, salt, hash", "[format]") {
    const std::uint8_t saltBytes[] = { 's', 'a', 'l', 't' };
    SecureBuffer salt(saltBytes, sizeof(saltBytes));
    auto key = PasswordHasher::deriveKey("password", salt, 4096, 32);

    REQUIRE(formatRecord(4096, salt, key) == kKnownRecord);

    SecureBuffer empty;
    REQUIRE_THROWS_AS(formatRecord(0, salt, key), std::invalid_argument);
    REQUIRE_THROWS_AS(formatRecord(-5, salt, key), std::invalid_argument);
    REQUIRE_THROWS_AS(formatRecord(1, empty, key), std::invalid_argument);
    REQUIRE_THROWS_AS(formatRecord(1, salt, empty), std::invalid_argument);
}

TEST_CASE("Record: parseRecord accepts a well-formed record", "[format][parse]") {
    auto parsed = parseRecord(kKnownRecord);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->iterations == 4096);
    REQUIRE(parsed->salt.size() == 4);
    REQUIRE(parsed->hash.size() == 32);
    REQUIRE(std::string(parsed->salt.begin(), parsed->salt.end()) == "salt");

    auto big = parseRecord("pbkdf2_sha256$2147483647$c2FsdA==$AAAA");
    REQUIRE(big.has_value());
    REQUIRE(big->iterations == 2147483647);
}

TEST_CASE("Record: malformed records are rejected", "[format][parse]") {
    PasswordHasher hasher;

    auto bad = GENERATE(as<std::string>{},
        "pbkdf2_sha256$",
        "pbkdf2_sha256",
        "pbkdf2_sha256$abc$def",
        "pbkdf2_sha256$-3$AAAA$BBBB",
        "pbkdf2_sha256$+3$AAAA$BBBB",
        "pbkdf2_sha256$NaN$AAAA$BBBB",
        "pbkdf2_sha256$0$AAAA$BBBB",
        "pbkdf2_sha256$ 3$AAAA$BBBB",
        "pbkdf2_sha256$1,000$AAAA$BBBB",
        "pbkdf2_sha256$2147483648$AAAA$BBBB",   // > INT_MAX
        "pbkdf2_sha256$12345678901$AAAA$BBBB",  // 11 digits
        "pbkdf2_sha256$1$$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=", // empty salt
        "pbkdf2_sha256$$1$c2FsdA==",
        "pbkdf2_sha256$4096$c2FsdA==$",
        "pbkdf2_sha256$4096$c2FsdA==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=$",
        "pbkdf2_sha256$4096$c2FsdA==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=$extra",
        "$pbkdf2_sha256$4096$c2FsdA==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=",
        " pbkdf2_sha256$4096$c2FsdA==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=",
        "PBKDF2_SHA256$4096$c2FsdA==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=",
        "pbkdf2_sha1$4096$c2FsdA==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=",
        "pbkdf2_sha256$4096$c2FsdA$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=",   // unpadded salt
        "pbkdf2_sha256$4096$c2Fs-A==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o=", // url-safe char
        "pbkdf2_sha256$4096$c2FsdA==$xeR41ZKIyEGqUw22hFxMjZYok6ABzk4RpJY4c6qYE0o= ");

    CAPTURE(bad);
    REQUIRE_FALSE(parseRecord(bad).has_value());
    REQUIRE_FALSE(hasher.verify("password", bad));
}

TEST_CASE("Record: tampered fields from a fresh hash are rejected", "[format][parse]") {
    PasswordHasher hasher(HashOptions{ 1000, 16, 32 });
    const std::string record = hasher.hash("password");
    REQUIRE(hasher.verify("password", record));

    SECTION("Wrong algorithm tag") {
        std::string other = "pbkdf2_sha1" + record.substr(std::string("pbkdf2_sha256").size());
        REQUIRE_FALSE(hasher.verify("password", other));
    }
    SECTION("Invalid character appended to salt") {
        auto parts = fields_of(record);
        parts[2] += "*";
        REQUIRE_FALSE(hasher.verify("password", join(parts)));
    }
    SECTION("Invalid character appended to hash") {
        auto parts = fields_of(record);
        parts[3] += "*";
        REQUIRE_FALSE(hasher.verify("password", join(parts)));
    }
    SECTION("Truncated salt") {
        auto parts = fields_of(record);
        parts[2].resize(parts[2].size() - 2);
        REQUIRE_FALSE(hasher.verify("password", join(parts)));
    }
    SECTION("Truncated hash") {
        auto parts = fields_of(record);
        parts[3].resize(parts[3].size() - 2);
        REQUIRE_FALSE(hasher.verify("password", join(parts)));
    }
    SECTION("Different iteration count") {
        auto parts = fields_of(record);
        parts[1] = "1001";
        REQUIRE_FALSE(hasher.verify("password", join(parts)));
    }
    SECTION("Hash swapped for one of the same length") {
        auto parts = fields_of(record);
        parts[3][0] = parts[3][0] == 'A' ? 'B' : 'A';
        REQUIRE_FALSE(hasher.verify("password", join(parts)));
    }
}

TEST_CASE("Record: fresh records are parsable and sane", "[format]") {
    PasswordHasher hasher(HashOptions{ 1000, 16, 32 });
    auto record = hasher.hash("password");

    auto parts = fields_of(record);
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[0] == RECORD_TAG);
    REQUIRE(parts[1] == "1000");
    REQUIRE(parts[2].size() == 24); // 16 bytes
    REQUIRE(parts[3].size() == 44); // 32 bytes

    auto parsed = parseRecord(record);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->salt.size() == 16);
    REQUIRE(parsed->hash.size() == 32);
}

TEST_CASE("Record: parsePositiveDecimal", "[format]") {
    REQUIRE(parsePositiveDecimal("1") == 1);
    REQUIRE(parsePositiveDecimal("300000") == 300000);
    REQUIRE(parsePositiveDecimal("0000000042") == 42);
    REQUIRE_FALSE(parsePositiveDecimal("").has_value());
    REQUIRE_FALSE(parsePositiveDecimal("0").has_value());
    REQUIRE_FALSE(parsePositiveDecimal("00000000000").has_value());
    REQUIRE_FALSE(parsePositiveDecimal("4294967296").has_value());
    REQUIRE_FALSE(parsePositiveDecimal("12a").has_value());
    REQUIRE_FALSE(parsePositiveDecimal("-1").has_value());
}
