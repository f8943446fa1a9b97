/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: id_generator.h

    Description:
        Random identifiers for jobs and workers. Job ids are UUIDv4 strings;
        a requeued batch always gets a fresh one so a late completion for the
        retired lease can never match the replacement.
*******************************************************************************/

#ifndef ID_GENERATOR_H
#define ID_GENERATOR_H

#include <cstdint>
#include <random>
#include <string>
#include <unistd.h>

namespace proxypool {

inline std::string generate_uuid4() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";

    uint64_t a = rng();
    uint64_t b = rng();

    // Version 4, RFC 4122 variant
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::string out;
    out.reserve(36);
    auto write = [&](uint64_t v, int nibbles) {
        for (int i = 0; i < nibbles; ++i) {
            out.push_back(hex[(v >> 60) & 0xF]);
            v <<= 4;
        }
    };

    write(a, 8);
    out.push_back('-');
    write(a << 32, 4);
    out.push_back('-');
    write(a << 48, 4);
    out.push_back('-');
    write(b, 4);
    out.push_back('-');
    write(b << 16, 12);
    return out;
}

// First `length` hex digits of a fresh UUID, used for short worker suffixes
inline std::string short_hex_id(size_t length = 8) {
    std::string id;
    for (char c : generate_uuid4()) {
        if (c != '-') id.push_back(c);
        if (id.size() == length) break;
    }
    return id;
}

inline std::string local_hostname() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown";
    }
    return std::string(buf);
}

} // namespace proxypool

#endif // ID_GENERATOR_H
