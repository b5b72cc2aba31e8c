// src/main.cpp
#include "PasswordHasher.hpp"
#include "RecordFormat.hpp"
#include "SecureBuffer.hpp"
#include "console_io.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>

// ----- Small helpers -----

static void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " hash [--iterations N] [--salt-bytes N] [--hash-bytes N]\n"
              << "  " << argv0 << " verify <record>\n"
              << "  " << argv0 << " inspect <record>\n";
}

// Parses "--name N" pairs into opts. Returns false on anything unknown.
static bool parse_hash_flags(const std::vector<std::string>& args, HashOptions& opts) {
    for (std::size_t i = 0; i < args.size(); i += 2) {
        if (i + 1 >= args.size()) {
            std::cerr << "Missing value for " << args[i] << "\n";
            return false;
        }
        auto value = parsePositiveDecimal(args[i + 1]);
        if (!value) {
            std::cerr << "Invalid value for " << args[i] << ": " << args[i + 1] << "\n";
            return false;
        }
        if      (args[i] == "--iterations") opts.iterations = *value;
        else if (args[i] == "--salt-bytes") opts.saltBytes  = *value;
        else if (args[i] == "--hash-bytes") opts.hashBytes  = *value;
        else {
            std::cerr << "Unknown option: " << args[i] << "\n";
            return false;
        }
    }
    return true;
}

// ----- Commands -----

static int action_hash(const HashOptions& opts) {
    std::string pw1 = prompt_hidden("Secret: ");
    std::string pw2 = prompt_hidden("Confirm secret: ");

    if (isBlank(pw1)) {
        std::cerr << "Empty secret not allowed.\n";
        secureWipe(pw1);
        secureWipe(pw2);
        return 1;
    }
    if (pw1 != pw2) {
        std::cerr << "Mismatch.\n";
        secureWipe(pw1);
        secureWipe(pw2);
        return 1;
    }
    secureWipe(pw2);

    try {
        PasswordHasher hasher(opts);
        std::string record = hasher.hash(pw1);
        secureWipe(pw1);
        std::cout << record << "\n";
        return 0;
    } catch (const std::exception&) {
        // scrub even on failure, then let main report it
        secureWipe(pw1);
        throw;
    }
}

static int action_verify(const std::string& record) {
    std::string pw = prompt_hidden("Secret: ");
    PasswordHasher hasher;
    bool ok = hasher.verify(pw, record);
    secureWipe(pw);

    if (!ok) {
        std::cout << "FAILED\n";
        return 2;
    }
    std::cout << "OK\n";
    return 0;
}

static int action_inspect(const std::string& record) {
    auto parsed = parseRecord(record);
    if (!parsed) {
        std::cerr << "Malformed record.\n";
        return 2;
    }
    std::cout << "algorithm : " << RECORD_TAG          << "\n"
              << "iterations: " << parsed->iterations  << "\n"
              << "salt bytes: " << parsed->salt.size() << "\n"
              << "hash bytes: " << parsed->hash.size() << "\n";
    return 0;
}

// ----- Main -----

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            print_usage(argv[0]);
            return 1;
        }
        const std::string cmd = argv[1];
        std::vector<std::string> rest(argv + 2, argv + argc);

        if (cmd == "hash") {
            HashOptions opts;
            if (!parse_hash_flags(rest, opts)) {
                print_usage(argv[0]);
                return 1;
            }
            return action_hash(opts);
        }
        if ((cmd == "verify" || cmd == "inspect") && rest.size() == 1) {
            return cmd == "verify" ? action_verify(rest[0]) : action_inspect(rest[0]);
        }

        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
