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
 * SamAudit Registry - OFFLINE REGF HIVE PARSER
 * ============================================================================
 *
 * @file HiveParser.hpp
 * @brief Reads exported registry hive files (REGF format) without any OS API.
 *
 * FORMAT COVERAGE:
 * ================
 *
 * - Base block ("regf", 4096 bytes): root cell, hive-bins size, sequence
 *   numbers (dirty detection) and header checksum
 * - Key nodes (nk): ASCII or UTF-16LE names, class names
 * - Subkey indexes: lf, lh, li and ri
 * - Value nodes (vk): resident data, cell data and big data (db) segments
 *
 * Every cell access is bounds-checked against the loaded image. A structural
 * violation surfaces as ErrorCode::CorruptHive; no partially decoded data is
 * ever returned.
 *
 * Transaction logs (.LOG1/.LOG2) are not replayed. A dirty hive is read as-is
 * and reported through HiveInfo::dirty.
 *
 * THREAD SAFETY: A loaded hive is immutable; OpenKey and the returned keys
 * may be used concurrently.
 * ============================================================================
 */

#pragma once

#include "RegistryHive.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Registry {

class HiveParserImpl;

// ============================================================================
// CONSTANTS
// ============================================================================

namespace RegfConstants {
    inline constexpr size_t BASE_BLOCK_SIZE = 4096;
    inline constexpr uint32_t INVALID_OFFSET = 0xFFFFFFFFu;
    inline constexpr uint16_t KEY_COMP_NAME = 0x0020;        ///< nk name stored as Latin-1
    inline constexpr uint16_t VALUE_COMP_NAME = 0x0001;      ///< vk name stored as Latin-1
    inline constexpr uint32_t DATA_IS_RESIDENT = 0x80000000u;
    inline constexpr uint32_t BIG_DATA_THRESHOLD = 16344;    ///< Max bytes per db segment
    inline constexpr uint32_t MAX_INDEX_DEPTH = 4;           ///< ri nesting tolerated
}

/**
 * @brief Base block metadata of a loaded hive
 */
struct HiveInfo {
    uint32_t primarySequence = 0;
    uint32_t secondarySequence = 0;
    uint32_t majorVersion = 0;
    uint32_t minorVersion = 0;
    uint32_t rootCellOffset = 0;
    uint32_t hiveBinsSize = 0;
    bool dirty = false;                 ///< Sequence numbers differ (unreplayed log)
    bool checksumValid = false;         ///< Base block XOR checksum matches
    std::string embeddedFileName;       ///< File name recorded in the base block
};

// ============================================================================
// HIVE PARSER
// ============================================================================

/**
 * @class HiveParser
 * @brief Offline registry hive backed by a REGF image in memory
 *
 * USAGE:
 * @code
 *     Registry::Error err;
 *     auto hive = Registry::HiveParser::Load("SYSTEM", &err);
 *     if (!hive) return false;
 *     auto key = hive->OpenKey("Select", &err);
 * @endcode
 */
class HiveParser final : public Hive {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /**
     * @brief Load and validate a hive file
     * @param path Hive file path
     * @param err IoError or NotAHive on failure
     * @return Parser, or nullptr on failure
     */
    [[nodiscard]] static std::unique_ptr<HiveParser> Load(const std::filesystem::path& path,
                                                          Error* err = nullptr);

    /**
     * @brief Validate and wrap an in-memory hive image
     */
    [[nodiscard]] static std::unique_ptr<HiveParser> FromBuffer(std::vector<uint8_t> image,
                                                                Error* err = nullptr);

    /// Callable only through Load and FromBuffer
    HiveParser(ConstructionKey, std::shared_ptr<const HiveParserImpl> impl) noexcept;
    ~HiveParser() override;

    HiveParser(const HiveParser&) = delete;
    HiveParser& operator=(const HiveParser&) = delete;

    [[nodiscard]] std::unique_ptr<HiveKey> OpenKey(std::string_view path,
                                                   Error* err = nullptr) const override;

    /**
     * @brief Base block metadata
     */
    [[nodiscard]] const HiveInfo& Info() const noexcept;

    /**
     * @brief Size of the loaded image in bytes
     */
    [[nodiscard]] size_t ImageSize() const noexcept;

private:
    std::shared_ptr<const HiveParserImpl> m_impl;
};

}  // namespace Registry
}  // namespace SamAudit
