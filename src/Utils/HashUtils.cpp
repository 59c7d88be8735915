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
#include "pch.h"
#include "HashUtils.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <fstream>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace SamAudit {
	namespace Utils {
		namespace HashUtils {

			namespace {

				const EVP_MD* ResolveMd(Algorithm alg) noexcept {
					switch (alg) {
					case Algorithm::MD5:    return EVP_md5();
					case Algorithm::SHA256: return EVP_sha256();
					}
					return nullptr;
				}

				void SetOpenSslError(Error* err, const wchar_t* what) noexcept {
					if (!err) return;
					err->openssl = ERR_get_error();
					if (err->openssl == 0) err->openssl = 1;
					err->message = what;
				}

				std::string ToHex(const uint8_t* data, size_t len, const char* digits) {
					std::string s;
					if (!data || len == 0) return s;
					s.resize(len * 2);
					for (size_t i = 0; i < len; ++i) {
						s[2 * i] = digits[data[i] >> 4];
						s[2 * i + 1] = digits[data[i] & 0x0F];
					}
					return s;
				}

				int HexValue(char c) noexcept {
					if (c >= '0' && c <= '9') return c - '0';
					if (c >= 'a' && c <= 'f') return c - 'a' + 10;
					if (c >= 'A' && c <= 'F') return c - 'A' + 10;
					return -1;
				}

			}  // namespace

			// ============================================================================
			// Comparison / Hex
			// ============================================================================

			bool Equal(const uint8_t* a, const uint8_t* b, size_t len) noexcept {
				if (len == 0) return true;
				if (!a || !b) return false;
				return CRYPTO_memcmp(a, b, len) == 0;
			}

			std::string ToHexLower(const uint8_t* data, size_t len) {
				return ToHex(data, len, "0123456789abcdef");
			}

			std::string ToHexUpper(const uint8_t* data, size_t len) {
				return ToHex(data, len, "0123456789ABCDEF");
			}

			bool FromHex(std::string_view hex, std::vector<uint8_t>& out) {
				out.clear();
				if (hex.size() % 2 != 0 || hex.size() > MAX_HEX_INPUT_SIZE) return false;

				out.reserve(hex.size() / 2);
				for (size_t i = 0; i < hex.size(); i += 2) {
					const int hi = HexValue(hex[i]);
					const int lo = HexValue(hex[i + 1]);
					if (hi < 0 || lo < 0) {
						out.clear();
						return false;
					}
					out.push_back(static_cast<uint8_t>((hi << 4) | lo));
				}
				return true;
			}

			size_t DigestSize(Algorithm alg) noexcept {
				switch (alg) {
				case Algorithm::MD5:    return 16;
				case Algorithm::SHA256: return 32;
				}
				return 0;
			}

			// ============================================================================
			// Hasher
			// ============================================================================

			Hasher::Hasher(Algorithm alg) noexcept
				: m_alg(alg), m_hashLen(DigestSize(alg)) {
			}

			Hasher::~Hasher() {
				if (m_ctx) {
					EVP_MD_CTX_free(m_ctx);
					m_ctx = nullptr;
				}
			}

			Hasher::Hasher(Hasher&& other) noexcept
				: m_ctx(other.m_ctx), m_alg(other.m_alg), m_hashLen(other.m_hashLen), m_inited(other.m_inited) {
				other.m_ctx = nullptr;
				other.m_inited = false;
			}

			Hasher& Hasher::operator=(Hasher&& other) noexcept {
				if (this != &other) {
					if (m_ctx) EVP_MD_CTX_free(m_ctx);
					m_ctx = other.m_ctx;
					m_alg = other.m_alg;
					m_hashLen = other.m_hashLen;
					m_inited = other.m_inited;
					other.m_ctx = nullptr;
					other.m_inited = false;
				}
				return *this;
			}

			bool Hasher::Init(Error* err) noexcept {
				m_inited = false;
				if (!m_ctx) {
					m_ctx = EVP_MD_CTX_new();
					if (!m_ctx) {
						SetOpenSslError(err, L"EVP_MD_CTX_new failed");
						return false;
					}
				}

				const EVP_MD* md = ResolveMd(m_alg);
				if (!md || EVP_DigestInit_ex(m_ctx, md, nullptr) != 1) {
					SetOpenSslError(err, L"EVP_DigestInit_ex failed");
					return false;
				}
				m_inited = true;
				return true;
			}

			bool Hasher::Update(const void* data, size_t len, Error* err) noexcept {
				if (!m_inited) {
					if (err) err->message = L"Hasher not initialized";
					return false;
				}
				if (len == 0) return true;
				if (!data) {
					if (err) err->message = L"Null input buffer";
					return false;
				}
				if (EVP_DigestUpdate(m_ctx, data, len) != 1) {
					SetOpenSslError(err, L"EVP_DigestUpdate failed");
					return false;
				}
				return true;
			}

			bool Hasher::Final(std::vector<uint8_t>& out, Error* err) noexcept {
				if (!m_inited) {
					if (err) err->message = L"Hasher not initialized";
					return false;
				}
				try {
					out.resize(EVP_MAX_MD_SIZE);
				}
				catch (const std::bad_alloc&) {
					if (err) err->message = L"Out of memory";
					return false;
				}

				unsigned int written = 0;
				m_inited = false;
				if (EVP_DigestFinal_ex(m_ctx, out.data(), &written) != 1) {
					out.clear();
					SetOpenSslError(err, L"EVP_DigestFinal_ex failed");
					return false;
				}
				out.resize(written);
				return true;
			}

			bool Hasher::FinalHex(std::string& outHex, bool upper, Error* err) noexcept {
				std::vector<uint8_t> digest;
				if (!Final(digest, err)) return false;
				try {
					outHex = upper ? ToHexUpper(digest) : ToHexLower(digest);
				}
				catch (const std::bad_alloc&) {
					if (err) err->message = L"Out of memory";
					return false;
				}
				return true;
			}

			// ============================================================================
			// One-Shot Helpers
			// ============================================================================

			bool Compute(Algorithm alg, const void* data, size_t len, std::vector<uint8_t>& out, Error* err) noexcept {
				Hasher h(alg);
				return h.Init(err) && h.Update(data, len, err) && h.Final(out, err);
			}

			bool ComputeHex(Algorithm alg, const void* data, size_t len, std::string& outHex, bool upper, Error* err) noexcept {
				Hasher h(alg);
				return h.Init(err) && h.Update(data, len, err) && h.FinalHex(outHex, upper, err);
			}

			bool ComputeFile(Algorithm alg, const std::filesystem::path& path, std::vector<uint8_t>& out, Error* err) noexcept {
				try {
					std::ifstream in(path, std::ios::binary);
					if (!in) {
						if (err) {
							err->sysErrno = errno;
							err->message = L"Cannot open file for hashing";
						}
						SA_LOG_ERRNO(L"HashUtils", L"Cannot open %ls", path.wstring().c_str());
						return false;
					}

					Hasher h(alg);
					if (!h.Init(err)) return false;

					std::vector<char> buf(FILE_HASH_BUFFER_SIZE);
					while (in) {
						in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
						const auto got = in.gcount();
						if (got > 0 && !h.Update(buf.data(), static_cast<size_t>(got), err)) {
							return false;
						}
					}
					if (in.bad()) {
						if (err) {
							err->sysErrno = errno;
							err->message = L"Read error while hashing file";
						}
						return false;
					}
					return h.Final(out, err);
				}
				catch (const std::exception&) {
					if (err) err->message = L"Exception while hashing file";
					return false;
				}
			}

		}  // namespace HashUtils
	}  // namespace Utils
}  // namespace SamAudit
