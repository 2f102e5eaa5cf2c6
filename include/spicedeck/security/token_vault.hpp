#pragma once
// ============================================================================
// SPICEDECK - Token Vault
// ============================================================================
// Password-protected storage for the GitHub personal access token
// PBKDF2-HMAC-SHA256 key derivation, AES-256-GCM authenticated encryption
//
// Blob layout (base64 encoded):
//   [version:1][salt:16][nonce:12][ciphertext:N][tag:16]
// ============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spicedeck::security {

struct VaultParams {
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t SALT_SIZE = 16;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t KEY_SIZE = 32;
    static constexpr int PBKDF2_ITERATIONS = 100000;
};

class TokenVault {
public:
    /// Encrypt `token` under `password`. Throws std::invalid_argument on an
    /// empty password, std::runtime_error if OpenSSL fails.
    [[nodiscard]] static std::string encrypt(std::string_view token, std::string_view password);

    /// Decrypt a blob produced by encrypt(). Returns nullopt on a malformed
    /// blob, a wrong password or tampered data.
    [[nodiscard]] static std::optional<std::string> decrypt(std::string_view blob,
                                                            std::string_view password);

    /// Derive the AES key from a password and salt
    [[nodiscard]] static std::vector<uint8_t> derive_key(std::string_view password,
                                                         const uint8_t* salt, size_t salt_len,
                                                         int iterations = VaultParams::PBKDF2_ITERATIONS);
};

/// Standard base64 with padding
[[nodiscard]] std::string base64_encode(const std::vector<uint8_t>& data);
[[nodiscard]] std::optional<std::vector<uint8_t>> base64_decode(std::string_view text);

}  // namespace spicedeck::security
