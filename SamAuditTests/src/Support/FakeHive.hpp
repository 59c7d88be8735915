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

#include "Registry/RegistryHive.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Testing {

/**
 * @brief In-memory hive for pipeline tests
 *
 * Keys are created on demand with every intermediate key; subkey order is
 * insertion order.
 */
class FakeHive final : public Registry::Hive {
public:
    struct Node {
        std::string name;
        std::vector<uint8_t> className;
        std::vector<std::string> subkeys;
        std::vector<Registry::HiveValue> values;
    };

    FakeHive();

    /// Create a key (and its parents)
    Node& AddKey(std::string_view path);

    FakeHive& SetClass(std::string_view path, std::vector<uint8_t> className);
    FakeHive& SetValue(std::string_view path, std::string_view name, std::vector<uint8_t> data,
                       Registry::ValueType type = Registry::ValueType::Binary);

    [[nodiscard]] std::unique_ptr<Registry::HiveKey> OpenKey(std::string_view path,
                                                             Registry::Error* err = nullptr) const override;

private:
    static std::string Normalize(std::string_view path);

    std::map<std::string, Node> m_nodes;    ///< Keyed by uppercase normalized path
};

}  // namespace Testing
}  // namespace SamAudit
