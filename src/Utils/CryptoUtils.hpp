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
#pragma once
/**
 * @file CryptoUtils.hpp
 * @brief Symmetric cipher primitives used by the SAM key schedule.
 *
 * Provides:
 * - AES-CBC encryption/decryption (SymmetricCipher) over OpenSSL EVP
 * - RC4 keystream transform
 * - Single-block DES-ECB decryption with caller-supplied 8-byte keys
 * - Secure memory wiping
 *
 * The legacy ciphers (RC4, DES) exist only because Windows still protects
 * stored password hashes with them. They are not offered for new data.
 *
 * @note SymmetricCipher is NOT thread-safe. Use separate instances per thread.
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
	namespace Utils {
		namespace CryptoUtils {

			// ============================================================================
			// Constants
			// ============================================================================

			/// AES block size in bytes
			inline constexpr size_t AES_BLOCK_SIZE = 16;

			/// DES block and key size in bytes
			inline constexpr size_t DES_BLOCK_SIZE = 8;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Cryptographic operation error information
			 *
			 * Captures the OpenSSL error queue head along with a descriptive
			 * message and the operation context.
			 */
			struct Error {
				unsigned long openssl = 0;         ///< ERR_get_error() code, 0 if not an OpenSSL failure
				std::wstring message;              ///< Human-readable error message
				std::wstring context;              ///< Operation context where error occurred

				/**
				 * @brief Check if an error occurred
				 * @return true if any error information is set
				 */
				[[nodiscard]] bool HasError() const noexcept {
					return openssl != 0 || !message.empty();
				}

				/**
				 * @brief Reset error state to success
				 */
				void Clear() noexcept {
					openssl = 0;
					message.clear();
					context.clear();
				}

				/**
				 * @brief Record an OpenSSL failure, draining the thread's error queue head
				 * @param msg Error message
				 * @param ctx Operation context
				 */
				void SetOpenSslError(std::wstring_view msg, std::wstring_view ctx = L"") noexcept;

				/**
				 * @brief Record a parameter/usage error
				 * @param msg Error message
				 * @param ctx Operation context
				 */
				void SetError(std::wstring_view msg, std::wstring_view ctx = L"") noexcept;
			};

			// ============================================================================
			// Symmetric Encryption Algorithms
			// ============================================================================

			/**
			 * @brief Supported block cipher modes
			 */
			enum class SymmetricAlgorithm : uint8_t {
				AES_128_CBC = 0,   ///< AES-128 in CBC mode
				AES_192_CBC = 1,   ///< AES-192 in CBC mode
				AES_256_CBC = 2    ///< AES-256 in CBC mode
			};

			/**
			 * @brief Padding modes for block cipher operations
			 *
			 * @note None should only be used when data is already block-aligned.
			 */
			enum class PaddingMode : uint8_t {
				None = 0,   ///< No padding (data must be block-aligned)
				PKCS7 = 1   ///< PKCS#7 padding
			};

			/**
			 * @brief Select the AES-CBC variant matching a raw key length.
			 * @param keyLen Key length in bytes (16, 24 or 32)
			 * @param out Selected algorithm
			 * @return false for any other key length
			 */
			[[nodiscard]] bool AesCbcForKeySize(size_t keyLen, SymmetricAlgorithm& out) noexcept;

			/**
			 * @brief Key size in bytes for an algorithm
			 */
			[[nodiscard]] size_t KeySize(SymmetricAlgorithm algorithm) noexcept;

			/**
			 * @brief Block cipher wrapper with key/IV management.
			 *
			 * @example
			 * @code
			 * SymmetricCipher cipher(SymmetricAlgorithm::AES_128_CBC);
			 * cipher.SetPaddingMode(PaddingMode::None);
			 * if (!cipher.SetKey(key, &err) || !cipher.SetIV(iv, &err)) return false;
			 * std::vector<uint8_t> plain;
			 * if (!cipher.Decrypt(data, len, plain, &err)) return false;
			 * @endcode
			 */
			class SymmetricCipher {
			public:
				/**
				 * @brief Construct cipher with specified algorithm
				 * @param algorithm Symmetric algorithm to use
				 */
				explicit SymmetricCipher(SymmetricAlgorithm algorithm) noexcept;

				/**
				 * @brief Destructor - securely wipes key material
				 */
				~SymmetricCipher();

				// Non-copyable
				SymmetricCipher(const SymmetricCipher&) = delete;
				SymmetricCipher& operator=(const SymmetricCipher&) = delete;

				// Movable
				SymmetricCipher(SymmetricCipher&& other) noexcept;
				SymmetricCipher& operator=(SymmetricCipher&& other) noexcept;

				// ========== Key Management ==========

				/**
				 * @brief Set key from raw buffer
				 * @param key Key data (must match algorithm key size)
				 * @param keyLen Key length in bytes
				 * @param err Optional error output
				 * @return true on success
				 */
				[[nodiscard]] bool SetKey(const uint8_t* key, size_t keyLen, Error* err = nullptr) noexcept;

				[[nodiscard]] bool SetKey(const std::vector<uint8_t>& key, Error* err = nullptr) noexcept {
					return SetKey(key.data(), key.size(), err);
				}

				// ========== IV Management ==========

				/**
				 * @brief Set IV from raw buffer
				 * @param iv IV data (must be AES_BLOCK_SIZE bytes)
				 * @param ivLen IV length in bytes
				 * @param err Optional error output
				 * @return true on success
				 */
				[[nodiscard]] bool SetIV(const uint8_t* iv, size_t ivLen, Error* err = nullptr) noexcept;

				[[nodiscard]] bool SetIV(const std::vector<uint8_t>& iv, Error* err = nullptr) noexcept {
					return SetIV(iv.data(), iv.size(), err);
				}

				/**
				 * @brief Set padding mode for block cipher operations
				 */
				void SetPaddingMode(PaddingMode mode) noexcept { m_paddingMode = mode; }

				// ========== One-Shot Operations ==========

				/**
				 * @brief Encrypt data
				 * @param plaintext Input data
				 * @param plaintextLen Input length
				 * @param ciphertext Output ciphertext
				 * @param err Optional error output
				 * @return true on success
				 */
				[[nodiscard]] bool Encrypt(const uint8_t* plaintext, size_t plaintextLen,
				                           std::vector<uint8_t>& ciphertext, Error* err = nullptr) noexcept;

				/**
				 * @brief Decrypt data
				 * @param ciphertext Input ciphertext
				 * @param ciphertextLen Input length
				 * @param plaintext Output plaintext
				 * @param err Optional error output
				 * @return true on success
				 * @note With PaddingMode::None the input length must be a multiple of AES_BLOCK_SIZE.
				 */
				[[nodiscard]] bool Decrypt(const uint8_t* ciphertext, size_t ciphertextLen,
				                           std::vector<uint8_t>& plaintext, Error* err = nullptr) noexcept;

				[[nodiscard]] SymmetricAlgorithm GetAlgorithm() const noexcept { return m_algorithm; }
				[[nodiscard]] size_t GetKeySize() const noexcept { return KeySize(m_algorithm); }

			private:
				[[nodiscard]] bool Run(bool encrypt, const uint8_t* in, size_t inLen,
				                       std::vector<uint8_t>& out, Error* err) noexcept;

				SymmetricAlgorithm m_algorithm;
				PaddingMode m_paddingMode = PaddingMode::PKCS7;
				std::array<uint8_t, 32> m_key{};
				std::array<uint8_t, AES_BLOCK_SIZE> m_iv{};
				bool m_keySet = false;
				bool m_ivSet = false;
			};

			// ============================================================================
			// Legacy Stream/Block Primitives
			// ============================================================================

			/**
			 * @brief RC4 keystream XOR (encryption and decryption are identical).
			 * @param key RC4 key
			 * @param keyLen Key length in bytes (1..256)
			 * @param in Input bytes
			 * @param len Input length
			 * @param out Output bytes (resized to len)
			 * @param err Optional error output
			 * @return true on success
			 */
			[[nodiscard]] bool Rc4Transform(const uint8_t* key, size_t keyLen,
			                                const uint8_t* in, size_t len,
			                                std::vector<uint8_t>& out, Error* err = nullptr) noexcept;

			/**
			 * @brief Decrypt one 8-byte block with DES in ECB mode.
			 *
			 * The key is used as given; parity bits are neither checked nor corrected.
			 *
			 * @param key 8-byte DES key
			 * @param in 8-byte ciphertext block
			 * @param out 8-byte plaintext block
			 */
			void DesEcbDecryptBlock(const std::array<uint8_t, DES_BLOCK_SIZE>& key,
			                        const uint8_t* in, uint8_t* out) noexcept;

			// ============================================================================
			// Utility Functions
			// ============================================================================

			/**
			 * @brief Securely zero memory (not optimized away)
			 * @param ptr Memory to zero
			 * @param size Size in bytes
			 */
			void SecureZeroMemory(void* ptr, size_t size) noexcept;

			/**
			 * @brief Constant-time buffer comparison
			 */
			[[nodiscard]] bool SecureCompare(const uint8_t* a, const uint8_t* b, size_t len) noexcept;

		}  // namespace CryptoUtils
	}  // namespace Utils
}  // namespace SamAudit
