#include "Digest.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <memory>
#include <stdexcept>

namespace {
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
} // namespace

std::string Sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("sha256 digest failed");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &outLength) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    return HexEncode(out, outLength);
}

std::string HmacSha256Hex(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLength = 0;

    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &outLength)
        == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    return HexEncode(out, outLength);
}

std::string HexEncode(const unsigned char* data, std::size_t length) {
    static const char DIGITS[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        hex.push_back(DIGITS[data[i] >> 4]);
        hex.push_back(DIGITS[data[i] & 0x0F]);
    }

    return hex;
}
