#include "core/digest.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>

namespace cleanbook::core {

std::vector<uint8_t> Digest::sha256(std::string_view data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return {};

    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int hashLen = 0;

    if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) ||
        !EVP_DigestUpdate(ctx, data.data(), data.size()) ||
        !EVP_DigestFinal_ex(ctx, hash.data(), &hashLen)) {
        EVP_MD_CTX_free(ctx);
        return {};
    }

    EVP_MD_CTX_free(ctx);
    hash.resize(hashLen);
    return hash;
}

std::vector<uint8_t> Digest::hmacSha256(const std::vector<uint8_t>& key,
                                        std::string_view data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return {};

    EVP_PKEY* pkey = EVP_PKEY_new_mac_key(EVP_PKEY_HMAC, nullptr,
        key.data(), static_cast<int>(key.size()));
    if (!pkey) {
        EVP_MD_CTX_free(ctx);
        return {};
    }

    std::vector<uint8_t> signature;
    size_t sigLen = 0;
    if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) == 1 &&
        EVP_DigestSignUpdate(ctx, data.data(), data.size()) == 1 &&
        EVP_DigestSignFinal(ctx, nullptr, &sigLen) == 1) {
        signature.resize(sigLen);
        if (EVP_DigestSignFinal(ctx, signature.data(), &sigLen) == 1) {
            signature.resize(sigLen);
        } else {
            signature.clear();
        }
    }

    EVP_PKEY_free(pkey);
    EVP_MD_CTX_free(ctx);
    return signature;
}

std::string Digest::toHex(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    for (auto b : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

bool Digest::randomBytes(std::vector<uint8_t>& out) {
    if (out.empty()) return true;
    return RAND_bytes(out.data(), static_cast<int>(out.size())) == 1;
}

} // namespace cleanbook::core
