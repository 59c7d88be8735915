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
#include "StringUtils.hpp"

namespace SamAudit {
	namespace Utils {
		namespace StringUtils {

			namespace {

				void AppendUtf8(std::string& out, char32_t cp) {
					if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
						cp = REPLACEMENT_CHAR;
					}
					if (cp < 0x80) {
						out.push_back(static_cast<char>(cp));
					}
					else if (cp < 0x800) {
						out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
						out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
					}
					else if (cp < 0x10000) {
						out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
						out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
						out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
					}
					else {
						out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
						out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
						out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
						out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
					}
				}

				void AppendWide(std::wstring& out, char32_t cp) {
					if constexpr (sizeof(wchar_t) == 2) {
						if (cp >= 0x10000) {
							cp -= 0x10000;
							out.push_back(static_cast<wchar_t>(0xD800 + (cp >> 10)));
							out.push_back(static_cast<wchar_t>(0xDC00 + (cp & 0x3FF)));
							return;
						}
					}
					out.push_back(static_cast<wchar_t>(cp));
				}

				/// Decode one UTF-8 sequence at s[i], advancing i.
				char32_t DecodeUtf8(std::string_view s, size_t& i) noexcept {
					const auto b0 = static_cast<uint8_t>(s[i++]);
					if (b0 < 0x80) return b0;

					size_t extra = 0;
					char32_t cp = 0;
					char32_t minValue = 0;
					if ((b0 & 0xE0) == 0xC0) { extra = 1; cp = b0 & 0x1F; minValue = 0x80; }
					else if ((b0 & 0xF0) == 0xE0) { extra = 2; cp = b0 & 0x0F; minValue = 0x800; }
					else if ((b0 & 0xF8) == 0xF0) { extra = 3; cp = b0 & 0x07; minValue = 0x10000; }
					else return REPLACEMENT_CHAR;

					for (size_t k = 0; k < extra; ++k) {
						if (i >= s.size()) return REPLACEMENT_CHAR;
						const auto b = static_cast<uint8_t>(s[i]);
						if ((b & 0xC0) != 0x80) return REPLACEMENT_CHAR;
						cp = (cp << 6) | (b & 0x3F);
						++i;
					}
					if (cp < minValue || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
						return REPLACEMENT_CHAR;
					}
					return cp;
				}

			}  // namespace

			std::string Utf16LeToUtf8(std::span<const uint8_t> bytes, bool skipBom) {
				std::string out;
				out.reserve(bytes.size());

				const size_t units = bytes.size() / 2;
				size_t i = 0;
				auto unitAt = [&](size_t idx) -> char16_t {
					return static_cast<char16_t>(bytes[idx * 2] | (bytes[idx * 2 + 1] << 8));
				};

				if (skipBom && units > 0 && unitAt(0) == BOM) {
					i = 1;
				}

				while (i < units) {
					const char16_t u = unitAt(i++);
					if (u >= 0xD800 && u <= 0xDBFF) {
						if (i < units) {
							const char16_t lo = unitAt(i);
							if (lo >= 0xDC00 && lo <= 0xDFFF) {
								++i;
								AppendUtf8(out, 0x10000 + ((static_cast<char32_t>(u) - 0xD800) << 10) + (lo - 0xDC00));
								continue;
							}
						}
						AppendUtf8(out, REPLACEMENT_CHAR);
					}
					else if (u >= 0xDC00 && u <= 0xDFFF) {
						AppendUtf8(out, REPLACEMENT_CHAR);
					}
					else {
						AppendUtf8(out, u);
					}
				}

				if (bytes.size() % 2 != 0) {
					AppendUtf8(out, REPLACEMENT_CHAR);
				}
				return out;
			}

			std::string Latin1ToUtf8(std::span<const uint8_t> bytes) {
				std::string out;
				out.reserve(bytes.size());
				for (const uint8_t b : bytes) {
					AppendUtf8(out, b);
				}
				return out;
			}

			std::wstring ToWide(std::string_view utf8) {
				std::wstring out;
				out.reserve(utf8.size());
				size_t i = 0;
				while (i < utf8.size()) {
					AppendWide(out, DecodeUtf8(utf8, i));
				}
				return out;
			}

			std::string ToNarrow(std::wstring_view wide) {
				std::string out;
				out.reserve(wide.size());
				for (size_t i = 0; i < wide.size(); ++i) {
					char32_t cp = static_cast<char32_t>(wide[i]);
					if constexpr (sizeof(wchar_t) == 2) {
						if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < wide.size()) {
							const char32_t lo = static_cast<char32_t>(wide[i + 1]);
							if (lo >= 0xDC00 && lo <= 0xDFFF) {
								cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
								++i;
							}
						}
					}
					AppendUtf8(out, cp);
				}
				return out;
			}

			std::string ToUpperAscii(std::string_view s) {
				std::string out(s);
				for (char& c : out) {
					if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
				}
				return out;
			}

			std::string ToLowerAscii(std::string_view s) {
				std::string out(s);
				for (char& c : out) {
					if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
				}
				return out;
			}

			bool EqualsIgnoreCaseAscii(std::string_view a, std::string_view b) noexcept {
				if (a.size() != b.size()) return false;
				for (size_t i = 0; i < a.size(); ++i) {
					char x = a[i];
					char y = b[i];
					if (x >= 'a' && x <= 'z') x = static_cast<char>(x - 'a' + 'A');
					if (y >= 'a' && y <= 'z') y = static_cast<char>(y - 'a' + 'A');
					if (x != y) return false;
				}
				return true;
			}

			std::string_view Trim(std::string_view s) noexcept {
				constexpr std::string_view ws = " \t\r\n";
				const size_t first = s.find_first_not_of(ws);
				if (first == std::string_view::npos) return {};
				const size_t last = s.find_last_not_of(ws);
				return s.substr(first, last - first + 1);
			}

			std::vector<std::string> Split(std::string_view s, char sep, bool skipEmpty) {
				std::vector<std::string> parts;
				size_t start = 0;
				while (true) {
					const size_t pos = s.find(sep, start);
					const std::string_view field = s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
					if (!skipEmpty || !field.empty()) {
						parts.emplace_back(field);
					}
					if (pos == std::string_view::npos) break;
					start = pos + 1;
				}
				return parts;
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace SamAudit
