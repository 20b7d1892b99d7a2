/*
 * Primus C++ - Sandbox Cipher
 *
 * Authenticated encryption for sandbox-private data at rest.
 * Sealed layout: nonce(12) || ciphertext || tag(16).
 */
#ifndef primus_SANDBOX_CIPHER_HPP
#define primus_SANDBOX_CIPHER_HPP

#include <string>

namespace primus {

class Cipher {
public:
    virtual ~Cipher() {}

    virtual bool seal(const std::string& plain, std::string& out) const = 0;
    // False when the data was tampered with or sealed under another key
    virtual bool open(const std::string& sealed, std::string& out) const = 0;
};

class AesGcmCipher : public Cipher {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t SALT_SIZE = 16;

    // `key` must hold KEY_SIZE bytes; see valid()
    explicit AesGcmCipher(const std::string& key);

    bool valid() const { return key_.size() == KEY_SIZE; }

    bool seal(const std::string& plain, std::string& out) const override;
    bool open(const std::string& sealed, std::string& out) const override;

    // PBKDF2-HMAC-SHA256
    static bool derive_key(const std::string& passphrase, const std::string& salt,
                           int iterations, std::string& out_key);

private:
    std::string key_;
};

} // namespace primus

#endif // primus_SANDBOX_CIPHER_HPP
