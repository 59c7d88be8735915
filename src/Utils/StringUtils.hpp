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
 * @file StringUtils.hpp
 * @brief Encoding conversion and ASCII string helpers.
 *
 * Registry hives store names as UTF-16LE or Latin-1, the log pipeline is
 * wide-character and reports are UTF-8. These helpers convert between the
 * three without depending on the process locale.
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
	namespace Utils {
		namespace StringUtils {

			/// Replacement character emitted for malformed input
			inline constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

			/// UTF-16 byte order mark
			inline constexpr char32_t BOM = 0xFEFF;

			// ============================================================================
			// Encoding Conversion
			// ============================================================================

			/**
			 * @brief Decode UTF-16LE bytes into UTF-8.
			 *
			 * Unpaired surrogates and a dangling odd byte decode to U+FFFD.
			 * Decoding stops at neither NUL nor any other code unit; the full
			 * buffer is converted.
			 *
			 * @param bytes UTF-16LE encoded input
			 * @param skipBom Drop a leading U+FEFF if present
			 * @return UTF-8 string
			 */
			[[nodiscard]] std::string Utf16LeToUtf8(std::span<const uint8_t> bytes, bool skipBom = true);

			/**
			 * @brief Decode Latin-1 (ISO-8859-1) bytes into UTF-8.
			 */
			[[nodiscard]] std::string Latin1ToUtf8(std::span<const uint8_t> bytes);

			/**
			 * @brief Decode UTF-8 into wide characters.
			 *
			 * Invalid sequences decode to U+FFFD.
			 */
			[[nodiscard]] std::wstring ToWide(std::string_view utf8);

			/**
			 * @brief Encode wide characters as UTF-8.
			 */
			[[nodiscard]] std::string ToNarrow(std::wstring_view wide);

			// ============================================================================
			// ASCII Helpers
			// ============================================================================

			/// @brief Uppercase ASCII letters, leave every other byte untouched
			[[nodiscard]] std::string ToUpperAscii(std::string_view s);

			/// @brief Lowercase ASCII letters, leave every other byte untouched
			[[nodiscard]] std::string ToLowerAscii(std::string_view s);

			/// @brief Compare two strings with ASCII case folding
			[[nodiscard]] bool EqualsIgnoreCaseAscii(std::string_view a, std::string_view b) noexcept;

			/// @brief Strip leading/trailing spaces, tabs, CR and LF
			[[nodiscard]] std::string_view Trim(std::string_view s) noexcept;

			/**
			 * @brief Split on a single-character separator.
			 * @param s Input text
			 * @param sep Separator
			 * @param skipEmpty Drop empty fields
			 * @return Fields in order of appearance
			 */
			[[nodiscard]] std::vector<std::string> Split(std::string_view s, char sep, bool skipEmpty = false);

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace SamAudit
