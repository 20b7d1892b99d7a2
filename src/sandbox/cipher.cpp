/*
 * Primus C++ - Sandbox Cipher Implementation (OpenSSL EVP AES-256-GCM)
 */
#include <primus/sandbox/cipher.hpp>
#include <primus/core/utils.hpp>
#include <openssl/evp.h>
#include <memory>

namespace primus {

namespace {

typedef std::unique_ptr<EVP_CIPHER_CTX, void (*)(EVP_CIPHER_CTX*)> CipherCtx;

CipherCtx new_ctx() {
    return CipherCtx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
}

unsigned char* bytes(std::string& s) {
    return reinterpret_cast<unsigned char*>(&s[0]);
}

const unsigned char* bytes(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

} // anonymous namespace

AesGcmCipher::AesGcmCipher(const std::string& key) : key_(key) {}

bool AesGcmCipher::seal(const std::string& plain, std::string& out) const {
    if (!valid()) return false;

    std::string nonce = random_bytes(NONCE_SIZE);
    if (nonce.size() != NONCE_SIZE) return false;

    CipherCtx ctx = new_ctx();
    if (!ctx) return false;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(nonce)) != 1) {
        return false;
    }

    std::string cipher(plain.size() + EVP_MAX_BLOCK_LENGTH, '\0');
    int len = 0;
    int total = 0;
    if (!plain.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), bytes(cipher), &len, bytes(plain), static_cast<int>(plain.size())) != 1) {
            return false;
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), bytes(cipher) + total, &len) != 1) {
        return false;
    }
    total += len;
    cipher.resize(static_cast<size_t>(total));

    std::string tag(TAG_SIZE, '\0');
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), bytes(tag)) != 1) {
        return false;
    }

    out = nonce + cipher + tag;
    return true;
}

bool AesGcmCipher::open(const std::string& sealed, std::string& out) const {
    if (!valid() || sealed.size() < NONCE_SIZE + TAG_SIZE) return false;

    const std::string nonce = sealed.substr(0, NONCE_SIZE);
    const std::string cipher = sealed.substr(NONCE_SIZE, sealed.size() - NONCE_SIZE - TAG_SIZE);
    std::string tag = sealed.substr(sealed.size() - TAG_SIZE);

    CipherCtx ctx = new_ctx();
    if (!ctx) return false;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(nonce)) != 1) {
        return false;
    }

    std::string plain(cipher.size() + EVP_MAX_BLOCK_LENGTH, '\0');
    int len = 0;
    int total = 0;
    if (!cipher.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), bytes(plain), &len, bytes(cipher), static_cast<int>(cipher.size())) != 1) {
            return false;
        }
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), bytes(tag)) != 1) {
        return false;
    }
    // Tag mismatch fails here
    if (EVP_DecryptFinal_ex(ctx.get(), bytes(plain) + total, &len) <= 0) {
        return false;
    }
    total += len;
    plain.resize(static_cast<size_t>(total));
    out = plain;
    return true;
}

bool AesGcmCipher::derive_key(const std::string& passphrase, const std::string& salt,
                              int iterations, std::string& out_key) {
    if (iterations <= 0 || salt.empty()) return false;

    std::string key(KEY_SIZE, '\0');
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          bytes(salt), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(),
                          static_cast<int>(KEY_SIZE), bytes(key)) != 1) {
        return false;
    }
    out_key = key;
    return true;
}

} // namespace primus
