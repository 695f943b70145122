#include "ObsAuth.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace ObsAuth {

std::string sha256(std::string_view data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    if (EVP_DigestFinal_ex(ctx, md, &mdLen) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    EVP_MD_CTX_free(ctx);
    return std::string(reinterpret_cast<const char*>(md), mdLen);
}

std::string base64Encode(std::string_view bytes) {
    if (bytes.empty()) return {};
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(bytes.data()),
                                        static_cast<int>(bytes.size()));
    if (written < 0) throw std::runtime_error("EVP_EncodeBlock failed");
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::string computeAuthResponse(std::string_view password, std::string_view salt, std::string_view challenge) {
    std::string salted(password);
    salted.append(salt);
    std::string secret = base64Encode(sha256(salted));
    secret.append(challenge);
    return base64Encode(sha256(secret));
}

} // namespace ObsAuth
