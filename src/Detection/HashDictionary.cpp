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
#include "HashDictionary.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace SamAudit {
namespace Detection {

bool HashDictionary::LoadFromFile(const std::filesystem::path& path, Error* err) {
    std::string text;
    Utils::FileUtils::Error ferr;
    if (!Utils::FileUtils::ReadAllTextUtf8(path, text, &ferr)) {
        if (err) {
            err->Set(ErrorCode::IoError, L"Cannot read hash dictionary: " +
                     Utils::StringUtils::ToWide(ferr.message), path.wstring());
        }
        return false;
    }

    const size_t skippedBefore = m_skipped;
    const size_t added = LoadFromText(text);
    SA_LOG_INFO(L"HashDictionary", L"Loaded %zu entries from %ls (%zu malformed lines skipped)",
                added, path.wstring().c_str(), m_skipped - skippedBefore);
    return true;
}

size_t HashDictionary::LoadFromText(std::string_view text) {
    if (text.size() >= 3 && static_cast<uint8_t>(text[0]) == 0xEF &&
        static_cast<uint8_t>(text[1]) == 0xBB && static_cast<uint8_t>(text[2]) == 0xBF) {
        text.remove_prefix(3);
    }

    size_t added = 0;
    for (const auto& rawLine : Utils::StringUtils::Split(text, '\n')) {
        std::string_view line = rawLine;
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (Utils::StringUtils::Trim(line).empty()) continue;

        const auto sep = line.find(';');
        if (sep == std::string_view::npos || line.find(';', sep + 1) != std::string_view::npos) {
            ++m_skipped;
            continue;
        }
        Add(line.substr(0, sep), line.substr(sep + 1));
        ++added;
    }
    return added;
}

void HashDictionary::Add(std::string_view hashHex, std::string_view cleartext) {
    m_entries.insert_or_assign(Utils::StringUtils::ToUpperAscii(Utils::StringUtils::Trim(hashHex)),
                               std::string(cleartext));
}

std::optional<std::string> HashDictionary::Lookup(std::string_view hashHex) const {
    if (hashHex.empty()) return std::nullopt;
    const auto it = m_entries.find(Utils::StringUtils::ToUpperAscii(hashHex));
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

void HashDictionary::Clear() noexcept {
    m_entries.clear();
    m_skipped = 0;
}

}  // namespace Detection
}  // namespace SamAudit
