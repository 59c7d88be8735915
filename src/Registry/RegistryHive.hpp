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
 * SamAudit Registry - HIVE ACCESS ABSTRACTION
 * ============================================================================
 *
 * @file RegistryHive.hpp
 * @brief Read-only view of a registry hive: keys, class names and values.
 *
 * The credential pipeline only needs to resolve a key by path, read its
 * class name, list its subkeys and fetch raw value payloads. Everything
 * above this interface is independent of where the hive bytes come from:
 * an offline REGF file (HiveParser) or an in-memory fake in tests.
 *
 * Paths are relative to the hive root and use '\' as separator. Name
 * matching is ASCII case-insensitive, like the Windows registry.
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Registry {

// ============================================================================
// ERROR HANDLING
// ============================================================================

/**
 * @brief Registry access failure categories
 */
enum class ErrorCode : uint8_t {
    None = 0,
    IoError,            ///< Hive file could not be read
    NotAHive,           ///< Missing "regf" signature or truncated base block
    CorruptHive,        ///< Cell/record bounds or signature violation
    KeyNotFound,        ///< A path component does not exist
    ValueNotFound       ///< Named value does not exist on the key
};

/**
 * @brief Registry error information
 */
struct Error {
    ErrorCode code = ErrorCode::None;
    std::wstring message;              ///< Human-readable error message
    std::wstring context;              ///< Key path or operation context

    [[nodiscard]] bool HasError() const noexcept { return code != ErrorCode::None; }

    void Clear() noexcept {
        code = ErrorCode::None;
        message.clear();
        context.clear();
    }

    void Set(ErrorCode c, std::wstring_view msg, std::wstring_view ctx = L"") noexcept {
        code = c;
        try {
            message = msg;
            context = ctx;
        }
        catch (const std::bad_alloc&) {
            message.clear();
            context.clear();
        }
    }
};

/**
 * @brief Short name for an error code
 */
[[nodiscard]] const wchar_t* ErrorCodeName(ErrorCode code) noexcept;

// ============================================================================
// VALUES
// ============================================================================

/**
 * @brief Registry value data types (winnt.h REG_*)
 */
enum class ValueType : uint32_t {
    None = 0,
    String = 1,
    ExpandString = 2,
    Binary = 3,
    Dword = 4,
    DwordBigEndian = 5,
    Link = 6,
    MultiString = 7,
    ResourceList = 8,
    FullResourceDescriptor = 9,
    ResourceRequirementsList = 10,
    Qword = 11
};

/**
 * @brief A value record with its raw payload
 */
struct HiveValue {
    std::string name;                   ///< Value name, UTF-8 ("" for the default value)
    ValueType type = ValueType::None;   ///< Declared type; payload is not reinterpreted
    std::vector<uint8_t> data;          ///< Raw payload bytes
};

// ============================================================================
// KEY / HIVE INTERFACES
// ============================================================================

/**
 * @brief A resolved registry key
 */
class HiveKey {
public:
    virtual ~HiveKey() = default;

    /// Key name (last path component), UTF-8
    [[nodiscard]] virtual const std::string& Name() const noexcept = 0;

    /// Raw class name bytes as stored (UTF-16LE); empty if the key has none
    [[nodiscard]] virtual const std::vector<uint8_t>& ClassName() const noexcept = 0;

    /// Subkey names in on-disk index order
    [[nodiscard]] virtual const std::vector<std::string>& SubkeyNames() const noexcept = 0;

    /// Value names in on-disk list order
    [[nodiscard]] virtual std::vector<std::string> ValueNames() const = 0;

    /**
     * @brief Fetch a value by name
     * @param name Value name (ASCII case-insensitive)
     * @param out Value record
     * @param err ValueNotFound or CorruptHive on failure
     */
    [[nodiscard]] virtual bool GetValue(std::string_view name, HiveValue& out,
                                        Error* err = nullptr) const = 0;
};

/**
 * @brief A read-only hive
 */
class Hive {
public:
    virtual ~Hive() = default;

    /**
     * @brief Resolve a key path relative to the hive root
     * @param path Backslash-separated path; empty opens the root key
     * @param err KeyNotFound or CorruptHive on failure
     * @return The key, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<HiveKey> OpenKey(std::string_view path,
                                                               Error* err = nullptr) const = 0;
};

/**
 * @brief Split a registry path into components, dropping empty ones
 */
[[nodiscard]] std::vector<std::string> SplitKeyPath(std::string_view path);

}  // namespace Registry
}  // namespace SamAudit
