// ============================================================================
// SPICEDECK - Token Vault Implementation
// ============================================================================

#include "spicedeck/security/token_vault.hpp"
#include "spicedeck/utils/logger.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <stdexcept>

namespace spicedeck::security {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

constexpr size_t HEADER_SIZE = 1 + VaultParams::SALT_SIZE + VaultParams::NONCE_SIZE;

// Wipes derived key material on scope exit
struct KeyGuard {
    std::vector<uint8_t>& key;
    ~KeyGuard() { OPENSSL_cleanse(key.data(), key.size()); }
};

}  // namespace

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    // EVP_EncodeBlock NUL-terminates its output
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view text) {
    if (text.empty() || text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(text.size() / 4 * 3);
    const int written = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the zero bytes that stand in for padding
    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

// ============================================================================
// TokenVault
// ============================================================================

std::vector<uint8_t> TokenVault::derive_key(std::string_view password,
                                            const uint8_t* salt, size_t salt_len,
                                            int iterations) {
    std::vector<uint8_t> key(VaultParams::KEY_SIZE);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt, static_cast<int>(salt_len), iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        throw std::runtime_error("PBKDF2 key derivation failed");
    }
    return key;
}

std::string TokenVault::encrypt(std::string_view token, std::string_view password) {
    if (password.empty()) {
        throw std::invalid_argument("an encryption password is required");
    }

    std::vector<uint8_t> blob(HEADER_SIZE + token.size() + VaultParams::TAG_SIZE);
    blob[0] = VaultParams::VERSION;
    uint8_t* salt = blob.data() + 1;
    uint8_t* nonce = salt + VaultParams::SALT_SIZE;
    uint8_t* ciphertext = nonce + VaultParams::NONCE_SIZE;
    uint8_t* tag = ciphertext + token.size();

    if (RAND_bytes(salt, static_cast<int>(VaultParams::SALT_SIZE)) != 1 ||
        RAND_bytes(nonce, static_cast<int>(VaultParams::NONCE_SIZE)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    auto key = derive_key(password, salt, VaultParams::SALT_SIZE);
    KeyGuard guard{key};

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    int len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(VaultParams::NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1 ||
        // The version byte is authenticated so it cannot be swapped
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, blob.data(), 1) != 1) {
        throw std::runtime_error("AES-GCM initialisation failed");
    }

    if (!token.empty() &&
        EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                          reinterpret_cast<const uint8_t*>(token.data()),
                          static_cast<int>(token.size())) != 1) {
        throw std::runtime_error("AES-GCM encryption failed");
    }

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + token.size(), &len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(VaultParams::TAG_SIZE), tag) != 1) {
        throw std::runtime_error("AES-GCM finalisation failed");
    }

    return base64_encode(blob);
}

std::optional<std::string> TokenVault::decrypt(std::string_view blob, std::string_view password) {
    auto raw = base64_decode(blob);
    if (!raw || raw->size() < HEADER_SIZE + VaultParams::TAG_SIZE) {
        LOG_WARN("Stored token is not a valid vault blob");
        return std::nullopt;
    }
    if ((*raw)[0] != VaultParams::VERSION) {
        LOG_WARN("Unsupported token vault version {}", static_cast<int>((*raw)[0]));
        return std::nullopt;
    }
    if (password.empty()) {
        return std::nullopt;
    }

    const uint8_t* salt = raw->data() + 1;
    const uint8_t* nonce = salt + VaultParams::SALT_SIZE;
    const uint8_t* ciphertext = nonce + VaultParams::NONCE_SIZE;
    const size_t ciphertext_len = raw->size() - HEADER_SIZE - VaultParams::TAG_SIZE;
    const uint8_t* tag = ciphertext + ciphertext_len;

    auto key = derive_key(password, salt, VaultParams::SALT_SIZE);
    KeyGuard guard{key};

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    std::string plaintext(ciphertext_len, '\0');
    auto* out = reinterpret_cast<uint8_t*>(plaintext.data());
    int len = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(VaultParams::NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1 ||
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, raw->data(), 1) != 1) {
        throw std::runtime_error("AES-GCM initialisation failed");
    }

    if (ciphertext_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), out, &len, ciphertext, static_cast<int>(ciphertext_len)) != 1) {
        return std::nullopt;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(VaultParams::TAG_SIZE),
                            const_cast<uint8_t*>(tag)) != 1) {
        return std::nullopt;
    }

    uint8_t final_block[16];
    if (EVP_DecryptFinal_ex(ctx.get(), final_block, &len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        LOG_WARN("Token decryption failed: wrong password or corrupted data");
        return std::nullopt;
    }

    return plaintext;
}

}  // namespace spicedeck::security
