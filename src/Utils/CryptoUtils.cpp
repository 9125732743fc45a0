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
#include "pch.h"
#include "CryptoUtils.hpp"
#include "Logger.hpp"

#include <climits>
#include <new>
#include <utility>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#ifdef _WIN32
#  include <dpapi.h>
#endif

namespace BrowserJar {
    namespace Utils {
        namespace CryptoUtils {

            namespace {

                void setError(Error* err, std::string msg, std::string ctx, unsigned long osslCode = 0) {
                    if (!err) return;
                    err->openssl = osslCode;
                    err->message = std::move(msg);
                    err->context = std::move(ctx);
                }

                void setOpenSSLError(Error* err, const char* what, const char* ctx) {
                    const unsigned long code = ERR_get_error();
                    ERR_clear_error();
                    if (!err) return;
                    std::string msg = what;
                    if (code != 0) {
                        char buf[256];
                        ERR_error_string_n(code, buf, sizeof(buf));
                        msg += ": ";
                        msg += buf;
                    }
                    setError(err, std::move(msg), ctx, code);
                }

                const EVP_CIPHER* CipherFor(SymmetricAlgorithm algorithm) noexcept {
                    switch (algorithm) {
                    case SymmetricAlgorithm::AES_128_CBC: return EVP_aes_128_cbc();
                    case SymmetricAlgorithm::AES_256_CBC: return EVP_aes_256_cbc();
                    case SymmetricAlgorithm::AES_128_GCM: return EVP_aes_128_gcm();
                    case SymmetricAlgorithm::AES_256_GCM: return EVP_aes_256_gcm();
                    }
                    return nullptr;
                }

                /// RAII owner for EVP_CIPHER_CTX
                struct CipherCtx {
                    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
                    ~CipherCtx() { if (ctx) EVP_CIPHER_CTX_free(ctx); }
                    CipherCtx() = default;
                    CipherCtx(const CipherCtx&) = delete;
                    CipherCtx& operator=(const CipherCtx&) = delete;
                };

                bool FitsInt(size_t n) noexcept {
                    return n <= static_cast<size_t>(INT_MAX);
                }

            } // anonymous namespace

            size_t KeySizeFor(SymmetricAlgorithm algorithm) noexcept {
                switch (algorithm) {
                case SymmetricAlgorithm::AES_128_CBC:
                case SymmetricAlgorithm::AES_128_GCM:
                    return 16;
                case SymmetricAlgorithm::AES_256_CBC:
                case SymmetricAlgorithm::AES_256_GCM:
                    return 32;
                }
                return 0;
            }

            bool IsAEAD(SymmetricAlgorithm algorithm) noexcept {
                return algorithm == SymmetricAlgorithm::AES_128_GCM ||
                       algorithm == SymmetricAlgorithm::AES_256_GCM;
            }

            // ============================================================================
            // SymmetricCipher
            // ============================================================================

            SymmetricCipher::SymmetricCipher(SymmetricAlgorithm algorithm) noexcept
                : m_algorithm(algorithm) {
            }

            SymmetricCipher::~SymmetricCipher() {
                SecureZero(m_key);
                SecureZero(m_iv);
            }

            SymmetricCipher::SymmetricCipher(SymmetricCipher&& other) noexcept
                : m_algorithm(other.m_algorithm)
                , m_paddingMode(other.m_paddingMode)
                , m_key(std::move(other.m_key))
                , m_iv(std::move(other.m_iv))
                , m_keySet(std::exchange(other.m_keySet, false))
                , m_ivSet(std::exchange(other.m_ivSet, false)) {
            }

            SymmetricCipher& SymmetricCipher::operator=(SymmetricCipher&& other) noexcept {
                if (this != &other) {
                    SecureZero(m_key);
                    SecureZero(m_iv);
                    m_algorithm = other.m_algorithm;
                    m_paddingMode = other.m_paddingMode;
                    m_key = std::move(other.m_key);
                    m_iv = std::move(other.m_iv);
                    m_keySet = std::exchange(other.m_keySet, false);
                    m_ivSet = std::exchange(other.m_ivSet, false);
                }
                return *this;
            }

            bool SymmetricCipher::SetKey(const uint8_t* key, size_t keyLen, Error* err) noexcept {
                if (!key || keyLen != KeySizeFor(m_algorithm)) {
                    setError(err, "Invalid key length " + std::to_string(keyLen), "SymmetricCipher::SetKey");
                    return false;
                }
                try {
                    SecureZero(m_key);
                    m_key.assign(key, key + keyLen);
                }
                catch (const std::bad_alloc&) {
                    setError(err, "Out of memory", "SymmetricCipher::SetKey");
                    return false;
                }
                m_keySet = true;
                return true;
            }

            bool SymmetricCipher::SetKey(const std::vector<uint8_t>& key, Error* err) noexcept {
                return SetKey(key.data(), key.size(), err);
            }

            bool SymmetricCipher::SetIV(const uint8_t* iv, size_t ivLen, Error* err) noexcept {
                const size_t expected = IsAEAD(m_algorithm) ? GCM_NONCE_SIZE : AES_BLOCK_SIZE;
                if (!iv || ivLen != expected) {
                    setError(err, "Invalid IV length " + std::to_string(ivLen), "SymmetricCipher::SetIV");
                    return false;
                }
                try {
                    m_iv.assign(iv, iv + ivLen);
                }
                catch (const std::bad_alloc&) {
                    setError(err, "Out of memory", "SymmetricCipher::SetIV");
                    return false;
                }
                m_ivSet = true;
                return true;
            }

            bool SymmetricCipher::SetIV(const std::vector<uint8_t>& iv, Error* err) noexcept {
                return SetIV(iv.data(), iv.size(), err);
            }

            bool SymmetricCipher::Encrypt(const uint8_t* plaintext, size_t plaintextLen,
                                          std::vector<uint8_t>& ciphertext, Error* err) noexcept {
                ciphertext.clear();
                if (IsAEAD(m_algorithm)) {
                    setError(err, "Use EncryptAEAD for GCM", "SymmetricCipher::Encrypt");
                    return false;
                }
                if (!m_keySet || !m_ivSet) {
                    setError(err, "Key or IV not set", "SymmetricCipher::Encrypt");
                    return false;
                }
                if ((!plaintext && plaintextLen) || !FitsInt(plaintextLen)) {
                    setError(err, "Invalid input", "SymmetricCipher::Encrypt");
                    return false;
                }
                if (m_paddingMode == PaddingMode::None && plaintextLen % AES_BLOCK_SIZE != 0) {
                    setError(err, "Input not block aligned", "SymmetricCipher::Encrypt");
                    return false;
                }

                CipherCtx c;
                if (!c.ctx) {
                    setOpenSSLError(err, "EVP_CIPHER_CTX_new failed", "SymmetricCipher::Encrypt");
                    return false;
                }
                if (EVP_EncryptInit_ex(c.ctx, CipherFor(m_algorithm), nullptr, m_key.data(), m_iv.data()) != 1 ||
                    EVP_CIPHER_CTX_set_padding(c.ctx, m_paddingMode == PaddingMode::PKCS7 ? 1 : 0) != 1) {
                    setOpenSSLError(err, "EVP_EncryptInit_ex failed", "SymmetricCipher::Encrypt");
                    return false;
                }

                try {
                    ciphertext.resize(plaintextLen + AES_BLOCK_SIZE);
                }
                catch (const std::bad_alloc&) {
                    setError(err, "Out of memory", "SymmetricCipher::Encrypt");
                    return false;
                }

                int outLen = 0;
                int finalLen = 0;
                if (EVP_EncryptUpdate(c.ctx, ciphertext.data(), &outLen, plaintext, static_cast<int>(plaintextLen)) != 1 ||
                    EVP_EncryptFinal_ex(c.ctx, ciphertext.data() + outLen, &finalLen) != 1) {
                    ciphertext.clear();
                    setOpenSSLError(err, "AES encryption failed", "SymmetricCipher::Encrypt");
                    return false;
                }
                ciphertext.resize(static_cast<size_t>(outLen + finalLen));
                return true;
            }

            bool SymmetricCipher::Decrypt(const uint8_t* ciphertext, size_t ciphertextLen,
                                          std::vector<uint8_t>& plaintext, Error* err) noexcept {
                plaintext.clear();
                if (IsAEAD(m_algorithm)) {
                    setError(err, "Use DecryptAEAD for GCM", "SymmetricCipher::Decrypt");
                    return false;
                }
                if (!m_keySet || !m_ivSet) {
                    setError(err, "Key or IV not set", "SymmetricCipher::Decrypt");
                    return false;
                }
                if (!ciphertext || ciphertextLen == 0 || ciphertextLen % AES_BLOCK_SIZE != 0 || !FitsInt(ciphertextLen)) {
                    setError(err, "Ciphertext length is not a positive multiple of the block size",
                        "SymmetricCipher::Decrypt");
                    return false;
                }

                CipherCtx c;
                if (!c.ctx) {
                    setOpenSSLError(err, "EVP_CIPHER_CTX_new failed", "SymmetricCipher::Decrypt");
                    return false;
                }
                if (EVP_DecryptInit_ex(c.ctx, CipherFor(m_algorithm), nullptr, m_key.data(), m_iv.data()) != 1 ||
                    EVP_CIPHER_CTX_set_padding(c.ctx, m_paddingMode == PaddingMode::PKCS7 ? 1 : 0) != 1) {
                    setOpenSSLError(err, "EVP_DecryptInit_ex failed", "SymmetricCipher::Decrypt");
                    return false;
                }

                try {
                    plaintext.resize(ciphertextLen + AES_BLOCK_SIZE);
                }
                catch (const std::bad_alloc&) {
                    setError(err, "Out of memory", "SymmetricCipher::Decrypt");
                    return false;
                }

                int outLen = 0;
                int finalLen = 0;
                if (EVP_DecryptUpdate(c.ctx, plaintext.data(), &outLen, ciphertext, static_cast<int>(ciphertextLen)) != 1 ||
                    EVP_DecryptFinal_ex(c.ctx, plaintext.data() + outLen, &finalLen) != 1) {
                    SecureZero(plaintext);
                    setOpenSSLError(err, "AES decryption failed (bad key or padding)", "SymmetricCipher::Decrypt");
                    return false;
                }
                plaintext.resize(static_cast<size_t>(outLen + finalLen));
                return true;
            }

            bool SymmetricCipher::EncryptAEAD(const uint8_t* plaintext, size_t plaintextLen,
                                              const uint8_t* aad, size_t aadLen,
                                              std::vector<uint8_t>& ciphertext,
                                              std::vector<uint8_t>& tag, Error* err) noexcept {
                ciphertext.clear();
                tag.clear();
                if (!IsAEAD(m_algorithm)) {
                    setError(err, "EncryptAEAD requires a GCM algorithm", "SymmetricCipher::EncryptAEAD");
                    return false;
                }
                if (!m_keySet || !m_ivSet) {
                    setError(err, "Key or nonce not set", "SymmetricCipher::EncryptAEAD");
                    return false;
                }
                if ((!plaintext && plaintextLen) || (!aad && aadLen) || !FitsInt(plaintextLen) || !FitsInt(aadLen)) {
                    setError(err, "Invalid input", "SymmetricCipher::EncryptAEAD");
                    return false;
                }

                CipherCtx c;
                if (!c.ctx ||
                    EVP_EncryptInit_ex(c.ctx, CipherFor(m_algorithm), nullptr, nullptr, nullptr) != 1 ||
                    EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(m_iv.size()), nullptr) != 1 ||
                    EVP_EncryptInit_ex(c.ctx, nullptr, nullptr, m_key.data(), m_iv.data()) != 1) {
                    setOpenSSLError(err, "AES-GCM init failed", "SymmetricCipher::EncryptAEAD");
                    return false;
                }

                int len = 0;
                if (aadLen > 0 && EVP_EncryptUpdate(c.ctx, nullptr, &len, aad, static_cast<int>(aadLen)) != 1) {
                    setOpenSSLError(err, "AES-GCM AAD failed", "SymmetricCipher::EncryptAEAD");
                    return false;
                }

                try {
                    ciphertext.resize(plaintextLen + AES_BLOCK_SIZE);
                    tag.resize(GCM_TAG_SIZE);
                }
                catch (const std::bad_alloc&) {
                    setError(err, "Out of memory", "SymmetricCipher::EncryptAEAD");
                    return false;
                }

                int outLen = 0;
                if (plaintextLen > 0 &&
                    EVP_EncryptUpdate(c.ctx, ciphertext.data(), &outLen, plaintext, static_cast<int>(plaintextLen)) != 1) {
                    setOpenSSLError(err, "AES-GCM encrypt failed", "SymmetricCipher::EncryptAEAD");
                    ciphertext.clear();
                    tag.clear();
                    return false;
                }
                int finalLen = 0;
                if (EVP_EncryptFinal_ex(c.ctx, ciphertext.data() + outLen, &finalLen) != 1 ||
                    EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE), tag.data()) != 1) {
                    setOpenSSLError(err, "AES-GCM finalize failed", "SymmetricCipher::EncryptAEAD");
                    ciphertext.clear();
                    tag.clear();
                    return false;
                }
                ciphertext.resize(static_cast<size_t>(outLen + finalLen));
                return true;
            }

            bool SymmetricCipher::DecryptAEAD(const uint8_t* ciphertext, size_t ciphertextLen,
                                              const uint8_t* aad, size_t aadLen,
                                              const uint8_t* tag, size_t tagLen,
                                              std::vector<uint8_t>& plaintext, Error* err) noexcept {
                plaintext.clear();
                if (!IsAEAD(m_algorithm)) {
                    setError(err, "DecryptAEAD requires a GCM algorithm", "SymmetricCipher::DecryptAEAD");
                    return false;
                }
                if (!m_keySet || !m_ivSet) {
                    setError(err, "Key or nonce not set", "SymmetricCipher::DecryptAEAD");
                    return false;
                }
                if (!tag || tagLen != GCM_TAG_SIZE) {
                    setError(err, "Invalid GCM tag length", "SymmetricCipher::DecryptAEAD");
                    return false;
                }
                if ((!ciphertext && ciphertextLen) || (!aad && aadLen) || !FitsInt(ciphertextLen) || !FitsInt(aadLen)) {
                    setError(err, "Invalid input", "SymmetricCipher::DecryptAEAD");
                    return false;
                }

                CipherCtx c;
                if (!c.ctx ||
                    EVP_DecryptInit_ex(c.ctx, CipherFor(m_algorithm), nullptr, nullptr, nullptr) != 1 ||
                    EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(m_iv.size()), nullptr) != 1 ||
                    EVP_DecryptInit_ex(c.ctx, nullptr, nullptr, m_key.data(), m_iv.data()) != 1) {
                    setOpenSSLError(err, "AES-GCM init failed", "SymmetricCipher::DecryptAEAD");
                    return false;
                }

                int len = 0;
                if (aadLen > 0 && EVP_DecryptUpdate(c.ctx, nullptr, &len, aad, static_cast<int>(aadLen)) != 1) {
                    setOpenSSLError(err, "AES-GCM AAD failed", "SymmetricCipher::DecryptAEAD");
                    return false;
                }

                try {
                    plaintext.resize(ciphertextLen + AES_BLOCK_SIZE);
                }
                catch (const std::bad_alloc&) {
                    setError(err, "Out of memory", "SymmetricCipher::DecryptAEAD");
                    return false;
                }

                int outLen = 0;
                if (ciphertextLen > 0 &&
                    EVP_DecryptUpdate(c.ctx, plaintext.data(), &outLen, ciphertext, static_cast<int>(ciphertextLen)) != 1) {
                    SecureZero(plaintext);
                    setOpenSSLError(err, "AES-GCM decrypt failed", "SymmetricCipher::DecryptAEAD");
                    return false;
                }

                // OpenSSL takes a non-const pointer for SET_TAG but does not modify it
                if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(tagLen),
                        const_cast<uint8_t*>(tag)) != 1) {
                    SecureZero(plaintext);
                    setOpenSSLError(err, "AES-GCM set tag failed", "SymmetricCipher::DecryptAEAD");
                    return false;
                }

                int finalLen = 0;
                if (EVP_DecryptFinal_ex(c.ctx, plaintext.data() + outLen, &finalLen) <= 0) {
                    SecureZero(plaintext);
                    setOpenSSLError(err, "AES-GCM authentication failed", "SymmetricCipher::DecryptAEAD");
                    return false;
                }
                plaintext.resize(static_cast<size_t>(outLen + finalLen));
                return true;
            }

            // ============================================================================
            // KeyDerivation
            // ============================================================================

            bool KeyDerivation::PBKDF2(const uint8_t* password, size_t passwordLen,
                                       const uint8_t* salt, size_t saltLen,
                                       uint32_t iterations,
                                       KDFHash hash,
                                       uint8_t* outKey, size_t keyLen,
                                       Error* err) noexcept {
                if (!outKey || keyLen == 0 || !FitsInt(keyLen)) {
                    setError(err, "Invalid output key buffer", "KeyDerivation::PBKDF2");
                    return false;
                }
                if (iterations == 0 || iterations > static_cast<uint32_t>(INT_MAX)) {
                    setError(err, "Invalid iteration count", "KeyDerivation::PBKDF2");
                    return false;
                }
                if ((!password && passwordLen) || (!salt && saltLen) || !FitsInt(passwordLen) || !FitsInt(saltLen)) {
                    setError(err, "Invalid password or salt", "KeyDerivation::PBKDF2");
                    return false;
                }

                // OpenSSL rejects a null password pointer even for zero length
                static const char kEmpty[1] = { 0 };
                const char* pass = password ? reinterpret_cast<const char*>(password) : kEmpty;
                static const unsigned char kNoSalt[1] = { 0 };
                const unsigned char* saltPtr = salt ? salt : kNoSalt;

                const EVP_MD* md = hash == KDFHash::SHA256 ? EVP_sha256() : EVP_sha1();
                if (PKCS5_PBKDF2_HMAC(pass, static_cast<int>(passwordLen),
                        saltPtr, static_cast<int>(saltLen),
                        static_cast<int>(iterations), md,
                        static_cast<int>(keyLen), outKey) != 1) {
                    setOpenSSLError(err, "PKCS5_PBKDF2_HMAC failed", "KeyDerivation::PBKDF2");
                    return false;
                }
                return true;
            }

            bool KeyDerivation::PBKDF2(std::string_view password,
                                       std::string_view salt,
                                       uint32_t iterations,
                                       KDFHash hash,
                                       size_t keyLen,
                                       std::vector<uint8_t>& outKey,
                                       Error* err) noexcept {
                try {
                    outKey.assign(keyLen, 0);
                }
                catch (const std::bad_alloc&) {
                    setError(err, "Out of memory", "KeyDerivation::PBKDF2");
                    return false;
                }
                if (!PBKDF2(reinterpret_cast<const uint8_t*>(password.data()), password.size(),
                        reinterpret_cast<const uint8_t*>(salt.data()), salt.size(),
                        iterations, hash, outKey.data(), outKey.size(), err)) {
                    outKey.clear();
                    return false;
                }
                return true;
            }

            // ============================================================================
            // DPAPI
            // ============================================================================

            bool DPAPIUnprotect(const uint8_t* data, size_t len, std::vector<uint8_t>& out, Error* err) noexcept {
                out.clear();
#ifdef _WIN32
                if (!data || len == 0 || len > MAXDWORD) {
                    setError(err, "Invalid DPAPI blob", "DPAPIUnprotect");
                    return false;
                }

                DATA_BLOB in{};
                in.cbData = static_cast<DWORD>(len);
                in.pbData = const_cast<BYTE*>(data);
                DATA_BLOB result{};

                if (!CryptUnprotectData(&in, nullptr, nullptr, nullptr, nullptr, 0, &result)) {
                    const DWORD code = GetLastError();
                    if (err) {
                        err->win32 = code;
                        err->message = "CryptUnprotectData failed with error " + std::to_string(code);
                        err->context = "DPAPIUnprotect";
                    }
                    return false;
                }

                struct LocalBlob {
                    DATA_BLOB& blob;
                    ~LocalBlob() {
                        if (blob.pbData) {
                            SecureWipe(blob.pbData, blob.cbData);
                            LocalFree(blob.pbData);
                        }
                    }
                } guard{ result };

                try {
                    out.assign(result.pbData, result.pbData + result.cbData);
                }
                catch (const std::bad_alloc&) {
                    setError(err, "Out of memory", "DPAPIUnprotect");
                    return false;
                }
                return true;
#else
                (void)data;
                (void)len;
                setError(err, "DPAPI is only available on Windows", "DPAPIUnprotect");
                return false;
#endif
            }

            // ============================================================================
            // Secure Memory
            // ============================================================================

            void SecureWipe(void* ptr, size_t size) noexcept {
                if (ptr && size) OPENSSL_cleanse(ptr, size);
            }

        } // namespace CryptoUtils
    } // namespace Utils
} // namespace BrowserJar
