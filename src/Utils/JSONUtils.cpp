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
#include "JSONUtils.hpp"
#include "FileUtils.hpp"


namespace SamAudit {
	namespace Utils {
		namespace JSON {

			namespace {

				/// Translate a byte offset into 1-based line/column
				void FillLineColumn(std::string_view text, size_t offset, Error& err) {
					err.byteOffset = offset;
					size_t line = 1;
					size_t col = 1;
					const size_t end = std::min(offset, text.size());
					for (size_t i = 0; i < end; ++i) {
						if (text[i] == '\n') {
							++line;
							col = 1;
						}
						else {
							++col;
						}
					}
					err.line = line;
					err.column = col;
				}

				size_t Depth(const Json& j, size_t current = 0) {
					size_t best = current;
					if (j.is_object() || j.is_array()) {
						for (const auto& child : j) {
							best = std::max(best, Depth(child, current + 1));
						}
					}
					return best;
				}

			}  // namespace

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				try {
					out = Json::parse(jsonText.begin(), jsonText.end(), nullptr, true, opt.allowComments);
					if (Depth(out) > opt.maxDepth) {
						out = Json();
						if (err) err->message = "JSON nesting exceeds maximum depth";
						return false;
					}
					return true;
				}
				catch (const nlohmann::json::parse_error& e) {
					out = Json();
					if (err) {
						err->message = e.what();
						FillLineColumn(jsonText, e.byte, *err);
					}
					return false;
				}
				catch (const nlohmann::json::exception& e) {
					out = Json();
					if (err) err->message = e.what();
					return false;
				}
				catch (const std::bad_alloc&) {
					out = Json();
					if (err) err->message = "out of memory";
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = j.dump(opt.pretty ? opt.indentSpaces : -1, ' ', opt.ensureAscii,
						Json::error_handler_t::replace);
					return true;
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
				catch (const std::bad_alloc&) {
					return false;
				}
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				std::string text;
				FileUtils::Error ferr;
				if (!FileUtils::ReadAllTextUtf8(path, text, &ferr, maxBytes)) {
					if (err) {
						err->message = ferr.message;
						err->path = path;
					}
					return false;
				}
				if (!Parse(text, out, err, opt)) {
					if (err) err->path = path;
					return false;
				}
				return true;
			}

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty()) return "";
					if (pathLike.front() == '/') return std::string(pathLike);

					std::string out;
					out.reserve(pathLike.size() + 8);
					std::string token;
					auto flush = [&]() {
						if (token.empty()) return;
						out.push_back('/');
						for (const char c : token) {
							if (c == '~') out += "~0";
							else if (c == '/') out += "~1";
							else out.push_back(c);
						}
						token.clear();
					};

					for (const char c : pathLike) {
						if (c == '.' || c == '[' || c == ']') {
							flush();
						}
						else {
							token.push_back(c);
						}
					}
					flush();
					return out.empty() ? "/" : out;
				}
				catch (const std::bad_alloc&) {
					return "";
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp.empty() || jp == "/") return true;
					return j.contains(nlohmann::json::json_pointer(jp));
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
				catch (const std::bad_alloc&) {
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace SamAudit
