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
 * @file FileUtils.hpp
 * @brief File system helpers for hive, dictionary and report files.
 *
 * All functions are noexcept and report failures through the optional
 * Error out-parameter.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
	namespace Utils {
		namespace FileUtils {

			/// Default ceiling for whole-file reads (hives are tens of KB to a few hundred MB)
			inline constexpr uint64_t DEFAULT_MAX_READ_BYTES = 512ULL * 1024 * 1024;

			/**
			 * @brief Error information for file operations.
			 */
			struct Error {
				int sysErrno = 0;           ///< errno captured at the failure point
				std::string message;        ///< Human-readable error description

				/// @brief Check if error is set
				[[nodiscard]] bool hasError() const noexcept { return sysErrno != 0 || !message.empty(); }

				/// @brief Clear the error state
				void clear() noexcept { sysErrno = 0; message.clear(); }
			};

			/**
			 * @brief Check whether a regular file exists at path.
			 */
			[[nodiscard]] bool IsRegularFile(const std::filesystem::path& path) noexcept;

			/**
			 * @brief Read an entire file into memory.
			 *
			 * @param path File to read
			 * @param out File contents (cleared on failure)
			 * @param err Optional error output
			 * @param maxBytes Refuse files larger than this
			 * @return true on success
			 */
			[[nodiscard]] bool ReadAllBytes(const std::filesystem::path& path, std::vector<uint8_t>& out,
			                                Error* err = nullptr, uint64_t maxBytes = DEFAULT_MAX_READ_BYTES) noexcept;

			/**
			 * @brief Read a UTF-8 text file, dropping a leading BOM.
			 */
			[[nodiscard]] bool ReadAllTextUtf8(const std::filesystem::path& path, std::string& out,
			                                   Error* err = nullptr, uint64_t maxBytes = DEFAULT_MAX_READ_BYTES) noexcept;

			/**
			 * @brief Write text through a temporary file and rename it into place.
			 *
			 * Creates parent directories as needed.
			 */
			[[nodiscard]] bool WriteAllTextUtf8Atomic(const std::filesystem::path& path, std::string_view utf8,
			                                          Error* err = nullptr) noexcept;

			/**
			 * @brief Delete a file. A missing file is not an error.
			 */
			[[nodiscard]] bool RemoveFile(const std::filesystem::path& path, Error* err = nullptr) noexcept;

			/**
			 * @brief Directory containing the running executable.
			 * @return Empty path if it cannot be determined
			 */
			[[nodiscard]] std::filesystem::path ExecutableDirectory() noexcept;

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace SamAudit
