/*
 * BrowserJar - Browser Cookie Extraction Engine
 * Copyright (C) 2026 BrowserJar Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
/**
 * @file CryptoUtils.hpp
 * @brief Cryptographic primitives used to open browser cookie stores.
 *
 * Provides:
 * - Symmetric encryption (AES-CBC with PKCS7, AES-GCM)
 * - Key derivation (PBKDF2-HMAC-SHA1/SHA256)
 * - Windows DPAPI unwrap
 * - Secure memory wiping
 *
 * AES and PBKDF2 are backed by OpenSSL libcrypto on every platform.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace BrowserJar {
    namespace Utils {
        namespace CryptoUtils {

            // ============================================================================
            // Constants
            // ============================================================================

            inline constexpr size_t AES_BLOCK_SIZE = 16;
            inline constexpr size_t GCM_NONCE_SIZE = 12;
            inline constexpr size_t GCM_TAG_SIZE = 16;

            // ============================================================================
            // Error Handling
            // ============================================================================

            struct Error {
                unsigned long openssl = 0;         ///< ERR_get_error() code, 0 if none
                unsigned long win32 = 0;           ///< GetLastError() for DPAPI failures
                std::string message;               ///< Human-readable error message
                std::string context;               ///< Operation context where error occurred

                [[nodiscard]] bool HasError() const noexcept {
                    return openssl != 0 || win32 != 0 || !message.empty();
                }

                void Clear() noexcept {
                    openssl = 0;
                    win32 = 0;
                    message.clear();
                    context.clear();
                }
            };

            // ============================================================================
            // Algorithms
            // ============================================================================

            enum class SymmetricAlgorithm : uint8_t {
                AES_128_CBC = 0,   ///< AES-128 in CBC mode (requires padding)
                AES_256_CBC = 1,   ///< AES-256 in CBC mode (requires padding)
                AES_128_GCM = 2,   ///< AES-128 in GCM mode (AEAD)
                AES_256_GCM = 3    ///< AES-256 in GCM mode (AEAD)
            };

            enum class PaddingMode : uint8_t {
                None = 0,   ///< No padding (data must be block-aligned)
                PKCS7 = 1   ///< PKCS#7 padding
            };

            enum class KDFHash : uint8_t {
                SHA1 = 0,
                SHA256 = 1
            };

            [[nodiscard]] size_t KeySizeFor(SymmetricAlgorithm algorithm) noexcept;
            [[nodiscard]] bool IsAEAD(SymmetricAlgorithm algorithm) noexcept;

            // ============================================================================
            // Symmetric Cipher
            // ============================================================================

            /**
             * @brief One-shot AES cipher bound to a key and IV.
             *
             * @code
             *   SymmetricCipher cipher(SymmetricAlgorithm::AES_128_CBC);
             *   if (!cipher.SetKey(key, &err) || !cipher.SetIV(iv, &err)) return false;
             *   std::vector<uint8_t> plain;
             *   if (!cipher.Decrypt(data, len, plain, &err)) return false;
             * @endcode
             *
             * @note This class is NOT thread-safe. Use separate instances per thread.
             */
            class SymmetricCipher {
            public:
                explicit SymmetricCipher(SymmetricAlgorithm algorithm) noexcept;
                ~SymmetricCipher();

                SymmetricCipher(const SymmetricCipher&) = delete;
                SymmetricCipher& operator=(const SymmetricCipher&) = delete;
                SymmetricCipher(SymmetricCipher&& other) noexcept;
                SymmetricCipher& operator=(SymmetricCipher&& other) noexcept;

                /**
                 * @brief Set the key; its length must match the algorithm.
                 */
                [[nodiscard]] bool SetKey(const uint8_t* key, size_t keyLen, Error* err = nullptr) noexcept;
                [[nodiscard]] bool SetKey(const std::vector<uint8_t>& key, Error* err = nullptr) noexcept;

                /**
                 * @brief Set the IV (16 bytes for CBC) or nonce (12 bytes for GCM).
                 */
                [[nodiscard]] bool SetIV(const uint8_t* iv, size_t ivLen, Error* err = nullptr) noexcept;
                [[nodiscard]] bool SetIV(const std::vector<uint8_t>& iv, Error* err = nullptr) noexcept;

                void SetPaddingMode(PaddingMode mode) noexcept { m_paddingMode = mode; }
                [[nodiscard]] PaddingMode GetPaddingMode() const noexcept { return m_paddingMode; }

                [[nodiscard]] SymmetricAlgorithm GetAlgorithm() const noexcept { return m_algorithm; }

                /**
                 * @brief Encrypt data (non-AEAD modes only)
                 */
                [[nodiscard]] bool Encrypt(const uint8_t* plaintext, size_t plaintextLen,
                    std::vector<uint8_t>& ciphertext, Error* err = nullptr) noexcept;

                /**
                 * @brief Decrypt data (non-AEAD modes only)
                 * @return false on bad padding or a key/IV mismatch
                 */
                [[nodiscard]] bool Decrypt(const uint8_t* ciphertext, size_t ciphertextLen,
                    std::vector<uint8_t>& plaintext, Error* err = nullptr) noexcept;

                /**
                 * @brief Encrypt with authentication (GCM)
                 * @param tag Output authentication tag (GCM_TAG_SIZE bytes)
                 */
                [[nodiscard]] bool EncryptAEAD(const uint8_t* plaintext, size_t plaintextLen,
                    const uint8_t* aad, size_t aadLen,
                    std::vector<uint8_t>& ciphertext,
                    std::vector<uint8_t>& tag, Error* err = nullptr) noexcept;

                /**
                 * @brief Decrypt with authentication verification (GCM)
                 * @return true on success, false on authentication failure
                 */
                [[nodiscard]] bool DecryptAEAD(const uint8_t* ciphertext, size_t ciphertextLen,
                    const uint8_t* aad, size_t aadLen,
                    const uint8_t* tag, size_t tagLen,
                    std::vector<uint8_t>& plaintext, Error* err = nullptr) noexcept;

            private:
                SymmetricAlgorithm m_algorithm;
                PaddingMode m_paddingMode = PaddingMode::PKCS7;
                std::vector<uint8_t> m_key;
                std::vector<uint8_t> m_iv;
                bool m_keySet = false;
                bool m_ivSet = false;
            };

            // ============================================================================
            // Key Derivation
            // ============================================================================

            class KeyDerivation {
            public:
                KeyDerivation() = delete;

                /**
                 * @brief Derive key using PBKDF2
                 * @param password Password bytes
                 * @param passwordLen Password length (0 is allowed)
                 * @param salt Salt bytes
                 * @param saltLen Salt length
                 * @param iterations Iteration count (>= 1)
                 * @param hash Underlying HMAC hash
                 * @param outKey Output key buffer
                 * @param keyLen Desired key length
                 * @param err Optional error output
                 * @return true on success
                 */
                [[nodiscard]] static bool PBKDF2(const uint8_t* password, size_t passwordLen,
                    const uint8_t* salt, size_t saltLen,
                    uint32_t iterations,
                    KDFHash hash,
                    uint8_t* outKey, size_t keyLen,
                    Error* err = nullptr) noexcept;

                /// @brief Convenience overload for text password and salt
                [[nodiscard]] static bool PBKDF2(std::string_view password,
                    std::string_view salt,
                    uint32_t iterations,
                    KDFHash hash,
                    size_t keyLen,
                    std::vector<uint8_t>& outKey,
                    Error* err = nullptr) noexcept;
            };

            // ============================================================================
            // Platform Data Protection
            // ============================================================================

            /**
             * @brief Unwrap a blob protected with CryptProtectData for the current user.
             *
             * Only available on Windows; elsewhere it fails with an error.
             */
            [[nodiscard]] bool DPAPIUnprotect(const uint8_t* data, size_t len,
                std::vector<uint8_t>& out, Error* err = nullptr) noexcept;

            // ============================================================================
            // Secure Memory
            // ============================================================================

            void SecureWipe(void* ptr, size_t size) noexcept;

            inline void SecureZero(std::vector<uint8_t>& buffer) noexcept {
                if (!buffer.empty()) SecureWipe(buffer.data(), buffer.size());
                buffer.clear();
            }

            inline void SecureZero(std::string& buffer) noexcept {
                if (!buffer.empty()) SecureWipe(buffer.data(), buffer.size());
                buffer.clear();
            }

        } // namespace CryptoUtils
    } // namespace Utils
} // namespace BrowserJar
