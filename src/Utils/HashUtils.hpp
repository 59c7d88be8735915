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
 * @file HashUtils.hpp
 * @brief Message digests and hex encoding for SamAudit.
 *
 * Provides:
 * - Incremental hashing (Hasher) on top of OpenSSL EVP
 * - One-shot and file hashing helpers
 * - Upper/lower hex encoding and strict hex decoding
 * - Constant-time digest comparison
 *
 * MD5 is required by the SAM key schedule and is exposed for that purpose only.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace SamAudit {
	namespace Utils {
		namespace HashUtils {

			// ============================================================================
			// Constants
			// ============================================================================

			/// Maximum input size for hex conversion (20MB hex = 10MB binary)
			inline constexpr size_t MAX_HEX_INPUT_SIZE = 20 * 1024 * 1024;

			/// Buffer size for file hashing
			inline constexpr size_t FILE_HASH_BUFFER_SIZE = 64 * 1024;

			// ============================================================================
			// Types and Enumerations
			// ============================================================================

			/**
			 * @brief Supported hash algorithms.
			 */
			enum class Algorithm : uint8_t {
				MD5,        ///< MD5 (128-bit) - SAM key schedule only
				SHA256      ///< SHA-256 (256-bit) - file fingerprints
			};

			/**
			 * @brief Error information for hash operations.
			 */
			struct Error {
				unsigned long openssl = 0;  ///< ERR_get_error() code (0 = none recorded)
				int sysErrno = 0;           ///< errno for file operations
				std::wstring message;       ///< Human-readable description

				/// @brief Check if an error occurred
				[[nodiscard]] bool hasError() const noexcept {
					return openssl != 0 || sysErrno != 0 || !message.empty();
				}

				/// @brief Clear error state
				void clear() noexcept {
					openssl = 0;
					sysErrno = 0;
					message.clear();
				}
			};

			// ============================================================================
			// Comparison Utilities
			// ============================================================================

			/**
			 * @brief Constant-time comparison of digests.
			 * @param a First buffer
			 * @param b Second buffer
			 * @param len Length of both buffers in bytes
			 * @return true if buffers are identical
			 */
			[[nodiscard]] bool Equal(const uint8_t* a, const uint8_t* b, size_t len) noexcept;

			// ============================================================================
			// Hex Conversion
			// ============================================================================

			/// @brief Lowercase hex encoding, no separators
			[[nodiscard]] std::string ToHexLower(const uint8_t* data, size_t len);

			/// @brief Uppercase hex encoding, no separators
			[[nodiscard]] std::string ToHexUpper(const uint8_t* data, size_t len);

			[[nodiscard]] inline std::string ToHexLower(const std::vector<uint8_t>& v) {
				return ToHexLower(v.data(), v.size());
			}

			[[nodiscard]] inline std::string ToHexUpper(const std::vector<uint8_t>& v) {
				return ToHexUpper(v.data(), v.size());
			}

			/**
			 * @brief Decode a hex string (either case, no separators).
			 *
			 * @param hex Input text; must have even length
			 * @param out Decoded bytes (cleared on failure)
			 * @return false on odd length, non-hex characters or oversized input
			 */
			[[nodiscard]] bool FromHex(std::string_view hex, std::vector<uint8_t>& out);

			/// @brief Digest size in bytes for an algorithm
			[[nodiscard]] size_t DigestSize(Algorithm alg) noexcept;

			// ============================================================================
			// Incremental Hasher
			// ============================================================================

			/**
			 * @brief Incremental hash computation.
			 *
			 * Usage:
			 * @code
			 *   Hasher h(Algorithm::MD5);
			 *   if (!h.Init()) return false;
			 *   if (!h.Update(salt, 16)) return false;
			 *   if (!h.Update(bootKey, 16)) return false;
			 *   std::vector<uint8_t> digest;
			 *   if (!h.Final(digest)) return false;
			 * @endcode
			 *
			 * @note Non-copyable, move-only.
			 */
			class Hasher {
			public:
				explicit Hasher(Algorithm alg = Algorithm::SHA256) noexcept;
				~Hasher();

				Hasher(const Hasher&) = delete;
				Hasher& operator=(const Hasher&) = delete;

				Hasher(Hasher&& other) noexcept;
				Hasher& operator=(Hasher&& other) noexcept;

				/**
				 * @brief Initialize hasher for a new computation.
				 *
				 * Must be called before Update(). Can be called again to reset.
				 */
				[[nodiscard]] bool Init(Error* err = nullptr) noexcept;

				/// @brief Feed data into the hash computation
				[[nodiscard]] bool Update(const void* data, size_t len, Error* err = nullptr) noexcept;

				/**
				 * @brief Finalize and retrieve the digest.
				 *
				 * The hasher can be reused by calling Init() again.
				 */
				[[nodiscard]] bool Final(std::vector<uint8_t>& out, Error* err = nullptr) noexcept;

				/// @brief Finalize and retrieve the digest as hex
				[[nodiscard]] bool FinalHex(std::string& outHex, bool upper = false, Error* err = nullptr) noexcept;

				[[nodiscard]] size_t GetDigestSize() const noexcept { return m_hashLen; }
				[[nodiscard]] Algorithm GetAlgorithm() const noexcept { return m_alg; }
				[[nodiscard]] bool IsInitialized() const noexcept { return m_inited; }

			private:
				EVP_MD_CTX* m_ctx = nullptr;    ///< OpenSSL digest context
				Algorithm m_alg;                ///< Selected algorithm
				size_t m_hashLen = 0;           ///< Digest size in bytes
				bool m_inited = false;          ///< Initialization state
			};

			// ============================================================================
			// One-Shot Hash Functions
			// ============================================================================

			/**
			 * @brief Compute a digest in one call.
			 */
			[[nodiscard]] bool Compute(Algorithm alg, const void* data, size_t len,
			                           std::vector<uint8_t>& out, Error* err = nullptr) noexcept;

			/**
			 * @brief Compute a digest and return it as hex.
			 */
			[[nodiscard]] bool ComputeHex(Algorithm alg, const void* data, size_t len,
			                              std::string& outHex, bool upper = false, Error* err = nullptr) noexcept;

			/**
			 * @brief Compute the digest of a file's contents.
			 *
			 * Reads the file in FILE_HASH_BUFFER_SIZE chunks.
			 */
			[[nodiscard]] bool ComputeFile(Algorithm alg, const std::filesystem::path& path,
			                               std::vector<uint8_t>& out, Error* err = nullptr) noexcept;

		}  // namespace HashUtils
	}  // namespace Utils
}  // namespace SamAudit
