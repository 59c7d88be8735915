/*
 * SamAudit - Offline Windows Credential Audit
 * Copyright (C) 2026 SamAudit Developers
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
// RC4 and DES are only reachable through the deprecated low-level API without the legacy provider.
#ifndef OPENSSL_SUPPRESS_DEPRECATED
#define OPENSSL_SUPPRESS_DEPRECATED
#endif

#include "pch.h"
#include "CryptoUtils.hpp"

#include <limits>

#include <openssl/crypto.h>
#include <openssl/des.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rc4.h>

namespace SamAudit {
	namespace Utils {
		namespace CryptoUtils {

			namespace {

				/**
				 * @brief Unique owner for 'EVP_CIPHER_CTX'.
				 */
				struct EvpCipherCtx {
					EVP_CIPHER_CTX* p{ nullptr };
					EvpCipherCtx() noexcept : p(EVP_CIPHER_CTX_new()) {}
					~EvpCipherCtx() { if (p) EVP_CIPHER_CTX_free(p); }
					EvpCipherCtx(const EvpCipherCtx&) = delete;
					EvpCipherCtx& operator=(const EvpCipherCtx&) = delete;
				};

				const EVP_CIPHER* ResolveCipher(SymmetricAlgorithm alg) noexcept {
					switch (alg) {
					case SymmetricAlgorithm::AES_128_CBC: return EVP_aes_128_cbc();
					case SymmetricAlgorithm::AES_192_CBC: return EVP_aes_192_cbc();
					case SymmetricAlgorithm::AES_256_CBC: return EVP_aes_256_cbc();
					}
					return nullptr;
				}

			}  // namespace

			// ============================================================================
			// Error
			// ============================================================================

			void Error::SetOpenSslError(std::wstring_view msg, std::wstring_view ctx) noexcept {
				openssl = ERR_get_error();
				if (openssl == 0) openssl = 1;
				try {
					message = msg;
					context = ctx;
				}
				catch (const std::bad_alloc&) {
					message.clear();
					context.clear();
				}
			}

			void Error::SetError(std::wstring_view msg, std::wstring_view ctx) noexcept {
				openssl = 0;
				try {
					message = msg;
					context = ctx;
				}
				catch (const std::bad_alloc&) {
					message.clear();
					context.clear();
				}
			}

			// ============================================================================
			// Algorithm Helpers
			// ============================================================================

			bool AesCbcForKeySize(size_t keyLen, SymmetricAlgorithm& out) noexcept {
				switch (keyLen) {
				case 16: out = SymmetricAlgorithm::AES_128_CBC; return true;
				case 24: out = SymmetricAlgorithm::AES_192_CBC; return true;
				case 32: out = SymmetricAlgorithm::AES_256_CBC; return true;
				default: return false;
				}
			}

			size_t KeySize(SymmetricAlgorithm algorithm) noexcept {
				switch (algorithm) {
				case SymmetricAlgorithm::AES_128_CBC: return 16;
				case SymmetricAlgorithm::AES_192_CBC: return 24;
				case SymmetricAlgorithm::AES_256_CBC: return 32;
				}
				return 0;
			}

			// ============================================================================
			// SymmetricCipher
			// ============================================================================

			SymmetricCipher::SymmetricCipher(SymmetricAlgorithm algorithm) noexcept
				: m_algorithm(algorithm) {
			}

			SymmetricCipher::~SymmetricCipher() {
				SecureZeroMemory(m_key.data(), m_key.size());
				SecureZeroMemory(m_iv.data(), m_iv.size());
			}

			SymmetricCipher::SymmetricCipher(SymmetricCipher&& other) noexcept
				: m_algorithm(other.m_algorithm)
				, m_paddingMode(other.m_paddingMode)
				, m_key(other.m_key)
				, m_iv(other.m_iv)
				, m_keySet(other.m_keySet)
				, m_ivSet(other.m_ivSet) {
				SecureZeroMemory(other.m_key.data(), other.m_key.size());
				other.m_keySet = false;
				other.m_ivSet = false;
			}

			SymmetricCipher& SymmetricCipher::operator=(SymmetricCipher&& other) noexcept {
				if (this != &other) {
					m_algorithm = other.m_algorithm;
					m_paddingMode = other.m_paddingMode;
					m_key = other.m_key;
					m_iv = other.m_iv;
					m_keySet = other.m_keySet;
					m_ivSet = other.m_ivSet;
					SecureZeroMemory(other.m_key.data(), other.m_key.size());
					other.m_keySet = false;
					other.m_ivSet = false;
				}
				return *this;
			}

			bool SymmetricCipher::SetKey(const uint8_t* key, size_t keyLen, Error* err) noexcept {
				if (!key || keyLen != KeySize(m_algorithm)) {
					if (err) err->SetError(L"Invalid key size for algorithm", L"SymmetricCipher::SetKey");
					return false;
				}
				SecureZeroMemory(m_key.data(), m_key.size());
				std::memcpy(m_key.data(), key, keyLen);
				m_keySet = true;
				return true;
			}

			bool SymmetricCipher::SetIV(const uint8_t* iv, size_t ivLen, Error* err) noexcept {
				if (!iv || ivLen != AES_BLOCK_SIZE) {
					if (err) err->SetError(L"IV must be 16 bytes", L"SymmetricCipher::SetIV");
					return false;
				}
				std::memcpy(m_iv.data(), iv, ivLen);
				m_ivSet = true;
				return true;
			}

			bool SymmetricCipher::Encrypt(const uint8_t* plaintext, size_t plaintextLen,
			                              std::vector<uint8_t>& ciphertext, Error* err) noexcept {
				return Run(true, plaintext, plaintextLen, ciphertext, err);
			}

			bool SymmetricCipher::Decrypt(const uint8_t* ciphertext, size_t ciphertextLen,
			                              std::vector<uint8_t>& plaintext, Error* err) noexcept {
				if (ciphertextLen % AES_BLOCK_SIZE != 0) {
					if (err) err->SetError(L"Ciphertext length is not a multiple of the block size", L"SymmetricCipher::Decrypt");
					return false;
				}
				return Run(false, ciphertext, ciphertextLen, plaintext, err);
			}

			bool SymmetricCipher::Run(bool encrypt, const uint8_t* in, size_t inLen,
			                          std::vector<uint8_t>& out, Error* err) noexcept {
				const wchar_t* ctxName = encrypt ? L"SymmetricCipher::Encrypt" : L"SymmetricCipher::Decrypt";
				out.clear();

				if (!m_keySet || !m_ivSet) {
					if (err) err->SetError(L"Key and IV must be set", ctxName);
					return false;
				}
				if (inLen > 0 && !in) {
					if (err) err->SetError(L"Null input buffer", ctxName);
					return false;
				}
				if (inLen > static_cast<size_t>(std::numeric_limits<int>::max()) - AES_BLOCK_SIZE) {
					if (err) err->SetError(L"Input too large", ctxName);
					return false;
				}
				if (m_paddingMode == PaddingMode::None && inLen % AES_BLOCK_SIZE != 0) {
					if (err) err->SetError(L"Input must be block-aligned without padding", ctxName);
					return false;
				}

				EvpCipherCtx ctx;
				if (!ctx.p) {
					if (err) err->SetOpenSslError(L"EVP_CIPHER_CTX_new failed", ctxName);
					return false;
				}

				const EVP_CIPHER* cipher = ResolveCipher(m_algorithm);
				if (EVP_CipherInit_ex(ctx.p, cipher, nullptr, m_key.data(), m_iv.data(), encrypt ? 1 : 0) != 1) {
					if (err) err->SetOpenSslError(L"EVP_CipherInit_ex failed", ctxName);
					return false;
				}
				EVP_CIPHER_CTX_set_padding(ctx.p, m_paddingMode == PaddingMode::PKCS7 ? 1 : 0);

				try {
					out.resize(inLen + AES_BLOCK_SIZE);
				}
				catch (const std::bad_alloc&) {
					if (err) err->SetError(L"Out of memory", ctxName);
					return false;
				}

				int outLen = 0;
				if (inLen > 0 && EVP_CipherUpdate(ctx.p, out.data(), &outLen, in, static_cast<int>(inLen)) != 1) {
					SecureZeroMemory(out.data(), out.size());
					out.clear();
					if (err) err->SetOpenSslError(L"EVP_CipherUpdate failed", ctxName);
					return false;
				}

				int finLen = 0;
				if (EVP_CipherFinal_ex(ctx.p, out.data() + outLen, &finLen) != 1) {
					SecureZeroMemory(out.data(), out.size());
					out.clear();
					if (err) err->SetOpenSslError(L"EVP_CipherFinal_ex failed", ctxName);
					return false;
				}

				out.resize(static_cast<size_t>(outLen + finLen));
				return true;
			}

			// ============================================================================
			// RC4 / DES
			// ============================================================================

			bool Rc4Transform(const uint8_t* key, size_t keyLen,
			                  const uint8_t* in, size_t len,
			                  std::vector<uint8_t>& out, Error* err) noexcept {
				if (!key || keyLen == 0 || keyLen > 256) {
					if (err) err->SetError(L"RC4 key must be 1..256 bytes", L"Rc4Transform");
					return false;
				}
				if (len > 0 && !in) {
					if (err) err->SetError(L"Null input buffer", L"Rc4Transform");
					return false;
				}
				try {
					out.resize(len);
				}
				catch (const std::bad_alloc&) {
					if (err) err->SetError(L"Out of memory", L"Rc4Transform");
					return false;
				}

				RC4_KEY schedule;
				RC4_set_key(&schedule, static_cast<int>(keyLen), key);
				if (len > 0) {
					RC4(&schedule, len, in, out.data());
				}
				SecureZeroMemory(&schedule, sizeof(schedule));
				return true;
			}

			void DesEcbDecryptBlock(const std::array<uint8_t, DES_BLOCK_SIZE>& key,
			                        const uint8_t* in, uint8_t* out) noexcept {
				DES_cblock rawKey;
				std::memcpy(rawKey, key.data(), DES_BLOCK_SIZE);

				DES_key_schedule schedule;
				DES_set_key_unchecked(&rawKey, &schedule);

				DES_cblock input;
				DES_cblock output;
				std::memcpy(input, in, DES_BLOCK_SIZE);
				DES_ecb_encrypt(&input, &output, &schedule, DES_DECRYPT);
				std::memcpy(out, output, DES_BLOCK_SIZE);

				SecureZeroMemory(&schedule, sizeof(schedule));
				SecureZeroMemory(rawKey, sizeof(rawKey));
				SecureZeroMemory(output, sizeof(output));
			}

			// ============================================================================
			// Utility Functions
			// ============================================================================

			void SecureZeroMemory(void* ptr, size_t size) noexcept {
				if (ptr && size) {
					OPENSSL_cleanse(ptr, size);
				}
			}

			bool SecureCompare(const uint8_t* a, const uint8_t* b, size_t len) noexcept {
				if (len == 0) return true;
				if (!a || !b) return false;
				return CRYPTO_memcmp(a, b, len) == 0;
			}

		}  // namespace CryptoUtils
	}  // namespace Utils
}  // namespace SamAudit
