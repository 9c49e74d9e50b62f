#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& message)
        : std::runtime_error(message) {}
};

// Seals secrets with AES-256-GCM. Each seal derives a fresh key from the
// master key and a random salt (HKDF-SHA256). The sealed form is
//
//   v1:<base64(salt | nonce | tag | ciphertext)>
class SecretManager {
public:
    static constexpr std::size_t KEY_SIZE = 32;
    static constexpr std::size_t SALT_SIZE = 16;
    static constexpr std::size_t NONCE_SIZE = 12;
    static constexpr std::size_t TAG_SIZE = 16;

    explicit SecretManager(std::vector<unsigned char> masterKey);
    ~SecretManager();

    SecretManager(const SecretManager&) = delete;
    SecretManager& operator=(const SecretManager&) = delete;

    std::string Seal(const std::string& secret) const;

    // Throws IntegrityError when the input was tampered with, truncated,
    // badly encoded or sealed under another master key.
    std::string Unseal(const std::string& sealed) const;

    // Reads the master key, creating a random one with mode 0600 when the
    // file does not exist yet.
    static std::vector<unsigned char> LoadOrCreateMasterKey(const std::string& path);

    static bool LooksSealed(const std::string& value);

private:
    std::vector<unsigned char> DeriveKey(const unsigned char* salt) const;

    std::vector<unsigned char> masterKey_;
};

// Overwrites the contents of a string holding secret material.
void WipeSecret(std::string& value);

// The platform credential as the rest of the process sees it: only the
// sealed form is held, the plaintext exists just for the duration of
// WithPlaintext().
class PlatformCredential {
public:
    PlatformCredential(const SecretManager& manager, std::string sealed)
        : manager_{manager}
        , sealed_{std::move(sealed)} {}

    const std::string& Sealed() const { return sealed_; }

    template <typename Fn>
    decltype(auto) WithPlaintext(Fn&& fn) const {
        struct Wiper {
            std::string& value;
            ~Wiper() { WipeSecret(value); }
        };

        std::string plaintext = manager_.Unseal(sealed_);
        Wiper wiper{plaintext};
        return fn(static_cast<const std::string&>(plaintext));
    }

private:
    const SecretManager& manager_;
    std::string sealed_;
};
