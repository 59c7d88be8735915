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
/**
 * ============================================================================
 * SamAudit Detection - KNOWN HASH DICTIONARY
 * ============================================================================
 *
 * @file HashDictionary.hpp
 * @brief Map of uppercase hex hash to cleartext, loaded from "hash;cleartext"
 *        line files.
 * ============================================================================
 */

#pragma once

#include "DetectionTypes.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace SamAudit {
namespace Detection {

/**
 * @class HashDictionary
 * @brief Known-weak password lookup table
 *
 * Lines that do not hold exactly one ';' are skipped and counted. CR/LF
 * line endings and a UTF-8 BOM are accepted. Later duplicates replace
 * earlier ones.
 */
class HashDictionary final {
public:
    HashDictionary() = default;

    /**
     * @brief Load entries from a file, adding to the current contents
     * @param err IoError on read failure
     */
    [[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Error* err = nullptr);

    /**
     * @brief Load entries from text, adding to the current contents
     * @return Number of entries added
     */
    size_t LoadFromText(std::string_view text);

    /// Add one entry; the hash is trimmed and uppercased
    void Add(std::string_view hashHex, std::string_view cleartext);

    /**
     * @brief Look up a hash (any case)
     */
    [[nodiscard]] std::optional<std::string> Lookup(std::string_view hashHex) const;

    [[nodiscard]] size_t Size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] size_t SkippedLines() const noexcept { return m_skipped; }

    void Clear() noexcept;

private:
    std::unordered_map<std::string, std::string> m_entries;
    size_t m_skipped = 0;
};

}  // namespace Detection
}  // namespace SamAudit
