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
#include "FileUtils.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

namespace SamAudit {
	namespace Utils {
		namespace FileUtils {

			namespace {

				void SetError(Error* err, int code, std::string msg) {
					if (!err) return;
					err->sysErrno = code;
					err->message = std::move(msg);
				}

			}  // namespace

			bool IsRegularFile(const std::filesystem::path& path) noexcept {
				std::error_code ec;
				return std::filesystem::is_regular_file(path, ec);
			}

			bool ReadAllBytes(const std::filesystem::path& path, std::vector<uint8_t>& out, Error* err, uint64_t maxBytes) noexcept {
				out.clear();
				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						SetError(err, ec.value(), "cannot stat " + path.string() + ": " + ec.message());
						return false;
					}
					if (size > maxBytes) {
						SetError(err, EFBIG, "file too large: " + path.string());
						return false;
					}

					std::ifstream in(path, std::ios::binary);
					if (!in) {
						const int code = errno;
						SetError(err, code, "cannot open " + path.string());
						SA_LOG_ERRNO(L"FileUtils", L"Cannot open %ls", path.wstring().c_str());
						return false;
					}

					out.resize(static_cast<size_t>(size));
					if (size > 0) {
						in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
						if (static_cast<uint64_t>(in.gcount()) != size) {
							out.clear();
							SetError(err, EIO, "short read from " + path.string());
							return false;
						}
					}
					return true;
				}
				catch (const std::bad_alloc&) {
					out.clear();
					SetError(err, ENOMEM, "out of memory reading " + path.string());
					return false;
				}
				catch (const std::exception& ex) {
					out.clear();
					SetError(err, EIO, ex.what());
					return false;
				}
			}

			bool ReadAllTextUtf8(const std::filesystem::path& path, std::string& out, Error* err, uint64_t maxBytes) noexcept {
				out.clear();
				std::vector<uint8_t> bytes;
				if (!ReadAllBytes(path, bytes, err, maxBytes)) return false;

				size_t start = 0;
				if (bytes.size() >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF) {
					start = 3;
				}
				try {
					out.assign(reinterpret_cast<const char*>(bytes.data()) + start, bytes.size() - start);
				}
				catch (const std::bad_alloc&) {
					SetError(err, ENOMEM, "out of memory");
					return false;
				}
				return true;
			}

			bool WriteAllTextUtf8Atomic(const std::filesystem::path& path, std::string_view utf8, Error* err) noexcept {
				try {
					std::error_code ec;
					if (path.has_parent_path()) {
						std::filesystem::create_directories(path.parent_path(), ec);
						if (ec) {
							SetError(err, ec.value(), "cannot create directory " + path.parent_path().string());
							return false;
						}
					}

					std::filesystem::path tmp = path;
					tmp += ".tmp";
					{
						std::ofstream outFile(tmp, std::ios::binary | std::ios::trunc);
						if (!outFile) {
							SetError(err, errno, "cannot create " + tmp.string());
							return false;
						}
						outFile.write(utf8.data(), static_cast<std::streamsize>(utf8.size()));
						outFile.flush();
						if (!outFile) {
							const int code = errno;
							outFile.close();
							std::filesystem::remove(tmp, ec);
							SetError(err, code, "write failed for " + tmp.string());
							return false;
						}
					}

					std::filesystem::rename(tmp, path, ec);
					if (ec) {
						std::error_code ignored;
						std::filesystem::remove(tmp, ignored);
						SetError(err, ec.value(), "cannot rename into " + path.string() + ": " + ec.message());
						return false;
					}
					return true;
				}
				catch (const std::exception& ex) {
					SetError(err, EIO, ex.what());
					return false;
				}
			}

			bool RemoveFile(const std::filesystem::path& path, Error* err) noexcept {
				std::error_code ec;
				std::filesystem::remove(path, ec);
				if (ec) {
					try {
						SetError(err, ec.value(), "cannot remove " + path.string() + ": " + ec.message());
					}
					catch (const std::bad_alloc&) {
						if (err) err->sysErrno = ec.value();
					}
					return false;
				}
				return true;
			}

			std::filesystem::path ExecutableDirectory() noexcept {
				std::error_code ec;
				const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
				if (ec) {
					SA_LOG_WARN(L"FileUtils", L"Cannot resolve executable path (error %d)", ec.value());
					return {};
				}
				try {
					return exe.parent_path();
				}
				catch (const std::bad_alloc&) {
					return {};
				}
			}

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace SamAudit
