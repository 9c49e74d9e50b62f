#include "SecretManager.hpp"

#include <boost/filesystem/operations.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>

namespace fs = boost::filesystem;

constexpr std::size_t SecretManager::KEY_SIZE;
constexpr std::size_t SecretManager::SALT_SIZE;
constexpr std::size_t SecretManager::NONCE_SIZE;
constexpr std::size_t SecretManager::TAG_SIZE;

namespace {
const char SEALED_PREFIX[] = "v1:";
const std::size_t SEALED_PREFIX_LENGTH = sizeof(SEALED_PREFIX) - 1;

unsigned char HKDF_INFO[] = "chatguard sealed secret v1";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string Base64Encode(const std::vector<unsigned char>& data) {
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    auto length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), data.data(),
        static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(length));
    return encoded;
}

std::vector<unsigned char> Base64Decode(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        throw IntegrityError("sealed secret has an invalid encoding");
    }

    std::vector<unsigned char> decoded(encoded.size() / 4 * 3);
    auto length = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
        static_cast<int>(encoded.size()));
    if (length < 0) {
        throw IntegrityError("sealed secret has an invalid encoding");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') {
        ++padding;
        if (encoded[encoded.size() - 2] == '=') {
            ++padding;
        }
    }

    decoded.resize(static_cast<std::size_t>(length) - padding);
    return decoded;
}

void RandomBytes(unsigned char* out, std::size_t length) {
    if (RAND_bytes(out, static_cast<int>(length)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}
} // namespace

SecretManager::SecretManager(std::vector<unsigned char> masterKey)
    : masterKey_{std::move(masterKey)} {
    if (masterKey_.size() != KEY_SIZE) {
        OPENSSL_cleanse(masterKey_.data(), masterKey_.size());
        throw IntegrityError("master key must be " + std::to_string(KEY_SIZE) + " bytes");
    }
}

SecretManager::~SecretManager() { OPENSSL_cleanse(masterKey_.data(), masterKey_.size()); }

std::string SecretManager::Seal(const std::string& secret) const {
    std::vector<unsigned char> blob(SALT_SIZE + NONCE_SIZE + TAG_SIZE + secret.size());
    unsigned char* salt = blob.data();
    unsigned char* nonce = salt + SALT_SIZE;
    unsigned char* tag = nonce + NONCE_SIZE;
    unsigned char* ciphertext = tag + TAG_SIZE;

    RandomBytes(salt, SALT_SIZE);
    RandomBytes(nonce, NONCE_SIZE);

    auto key = DeriveKey(salt);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    int length = 0;
    bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
        && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) == 1
        && EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) == 1
        && EVP_EncryptUpdate(ctx.get(), ciphertext, &length,
               reinterpret_cast<const unsigned char*>(secret.data()), static_cast<int>(secret.size()))
            == 1
        && EVP_EncryptFinal_ex(ctx.get(), ciphertext + length, &length) == 1
        && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) == 1;

    OPENSSL_cleanse(key.data(), key.size());
    if (!ok) {
        throw std::runtime_error("sealing secret failed");
    }

    return SEALED_PREFIX + Base64Encode(blob);
}

std::string SecretManager::Unseal(const std::string& sealed) const {
    if (!LooksSealed(sealed)) {
        throw IntegrityError("sealed secret has an unknown format");
    }

    auto blob = Base64Decode(sealed.substr(SEALED_PREFIX_LENGTH));
    if (blob.size() < SALT_SIZE + NONCE_SIZE + TAG_SIZE) {
        throw IntegrityError("sealed secret is truncated");
    }

    unsigned char* salt = blob.data();
    unsigned char* nonce = salt + SALT_SIZE;
    unsigned char* tag = nonce + NONCE_SIZE;
    unsigned char* ciphertext = tag + TAG_SIZE;
    const auto ciphertextLength = blob.size() - SALT_SIZE - NONCE_SIZE - TAG_SIZE;

    auto key = DeriveKey(salt);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    std::string plaintext(ciphertextLength, '\0');
    auto* out = reinterpret_cast<unsigned char*>(&plaintext[0]);

    int length = 0;
    int finalLength = 0;
    bool ok = EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
        && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) == 1
        && EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) == 1
        && EVP_DecryptUpdate(ctx.get(), out, &length, ciphertext, static_cast<int>(ciphertextLength)) == 1
        && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag) == 1
        && EVP_DecryptFinal_ex(ctx.get(), out + length, &finalLength) == 1;

    OPENSSL_cleanse(key.data(), key.size());
    if (!ok) {
        WipeSecret(plaintext);
        throw IntegrityError("sealed secret failed authentication");
    }

    plaintext.resize(static_cast<std::size_t>(length + finalLength));
    return plaintext;
}

std::vector<unsigned char> SecretManager::LoadOrCreateMasterKey(const std::string& path) {
    const fs::path keyPath{path};

    if (!fs::exists(keyPath)) {
        if (keyPath.has_parent_path()) {
            fs::create_directories(keyPath.parent_path());
        }

        std::vector<unsigned char> key(KEY_SIZE);
        RandomBytes(key.data(), key.size());

        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
        if (fd < 0) {
            throw std::runtime_error("cannot create master key " + path + ": " + std::strerror(errno));
        }

        auto written = ::write(fd, key.data(), key.size());
        ::close(fd);
        if (written != static_cast<ssize_t>(key.size())) {
            OPENSSL_cleanse(key.data(), key.size());
            throw std::runtime_error("cannot write master key " + path);
        }

        return key;
    }

    std::ifstream in{path.c_str(), std::ios::binary};
    if (!in) {
        throw std::runtime_error("cannot read master key " + path);
    }

    std::vector<unsigned char> key{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (key.size() != KEY_SIZE) {
        OPENSSL_cleanse(key.data(), key.size());
        throw IntegrityError("master key " + path + " has the wrong length");
    }

    return key;
}

bool SecretManager::LooksSealed(const std::string& value) {
    return value.compare(0, SEALED_PREFIX_LENGTH, SEALED_PREFIX) == 0;
}

std::vector<unsigned char> SecretManager::DeriveKey(const unsigned char* salt) const {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    std::vector<unsigned char> key(KEY_SIZE);
    std::size_t keyLength = key.size();

    if (EVP_PKEY_derive_init(ctx.get()) <= 0
        || EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0
        || EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), const_cast<unsigned char*>(salt), static_cast<int>(SALT_SIZE)) <= 0
        || EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), const_cast<unsigned char*>(masterKey_.data()),
               static_cast<int>(masterKey_.size()))
            <= 0
        || EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), HKDF_INFO, static_cast<int>(sizeof(HKDF_INFO) - 1)) <= 0
        || EVP_PKEY_derive(ctx.get(), key.data(), &keyLength) <= 0) {
        throw std::runtime_error("HKDF key derivation failed");
    }

    return key;
}

void WipeSecret(std::string& value) {
    if (!value.empty()) {
        OPENSSL_cleanse(&value[0], value.size());
    }
    value.clear();
}
