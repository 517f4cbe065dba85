#include "Password.h"
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace auth {

namespace {

constexpr std::string_view kUpper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view kLower = "abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kDigits = "0123456789";
constexpr std::string_view kSpecial = "!@#$%^&*";

void fill_random(unsigned char* out, std::size_t n) {
    if (RAND_bytes(out, static_cast<int>(n)) != 1) throw std::runtime_error("RAND_bytes failed");
}

// Uniform index in [0, bound) by rejection sampling over 32-bit draws. bound must be in [1, 2^32].
std::size_t uniform_index(std::size_t bound) {
    const uint64_t space = uint64_t(1) << 32;
    const uint64_t limit = space - (space % bound);
    uint64_t v = 0;
    do {
        unsigned char b[4];
        fill_random(b, sizeof(b));
        v = (uint64_t(b[0]) << 24) | (uint64_t(b[1]) << 16) | (uint64_t(b[2]) << 8) | uint64_t(b[3]);
    } while (v >= limit);
    return static_cast<std::size_t>(v % bound);
}

char pick(std::string_view set) { return set[uniform_index(set.size())]; }

}

std::string generate_password(std::size_t length) {
    if (length < 8) throw std::invalid_argument("password length must be at least 8");
    if (length > kMaxPasswordLength) throw std::invalid_argument("password length must be at most 256");
    std::string all;
    all.append(kUpper).append(kLower).append(kDigits).append(kSpecial);

    std::string pw;
    pw.reserve(length);
    pw.push_back(pick(kUpper));
    pw.push_back(pick(kLower));
    pw.push_back(pick(kDigits));
    pw.push_back(pick(kSpecial));
    while (pw.size() < length) pw.push_back(pick(all));

    for (std::size_t i = pw.size() - 1; i > 0; --i) {
        std::size_t j = uniform_index(i + 1);
        std::swap(pw[i], pw[j]);
    }
    return pw;
}

std::string random_token(std::size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    fill_random(buf.data(), buf.size());
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : buf) oss << std::setw(2) << static_cast<int>(c);
    OPENSSL_cleanse(buf.data(), buf.size());
    return oss.str();
}

}
