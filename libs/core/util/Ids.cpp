#include "Ids.hpp"
#include <openssl/rand.h>
#include <fmt/format.h>
#include <array>
#include <stdexcept>

std::string generateUuid() {
    std::array<unsigned char, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw std::runtime_error("Ids: failed to generate random bytes");
    }
    raw[6] = static_cast<unsigned char>((raw[6] & 0x0F) | 0x40);  // version 4
    raw[8] = static_cast<unsigned char>((raw[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < raw.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out += fmt::format("{:02x}", raw[i]);
    }
    return out;
}
