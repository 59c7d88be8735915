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
#include "FakeHive.hpp"

#include "Utils/StringUtils.hpp"

namespace SamAudit {
namespace Testing {

namespace {

    class FakeKey final : public Registry::HiveKey {
    public:
        explicit FakeKey(FakeHive::Node node) : m_node(std::move(node)) {}

        const std::string& Name() const noexcept override { return m_node.name; }
        const std::vector<uint8_t>& ClassName() const noexcept override { return m_node.className; }
        const std::vector<std::string>& SubkeyNames() const noexcept override { return m_node.subkeys; }

        std::vector<std::string> ValueNames() const override {
            std::vector<std::string> names;
            for (const auto& v : m_node.values) names.push_back(v.name);
            return names;
        }

        bool GetValue(std::string_view name, Registry::HiveValue& out, Registry::Error* err) const override {
            for (const auto& v : m_node.values) {
                if (Utils::StringUtils::EqualsIgnoreCaseAscii(v.name, name)) {
                    out = v;
                    return true;
                }
            }
            if (err) err->Set(Registry::ErrorCode::ValueNotFound, L"Value not found");
            return false;
        }

    private:
        FakeHive::Node m_node;
    };

}  // namespace

FakeHive::FakeHive() {
    m_nodes.emplace("", Node{});
}

std::string FakeHive::Normalize(std::string_view path) {
    std::string joined;
    for (const auto& part : Registry::SplitKeyPath(path)) {
        if (!joined.empty()) joined.push_back('\\');
        joined += Utils::StringUtils::ToUpperAscii(part);
    }
    return joined;
}

FakeHive::Node& FakeHive::AddKey(std::string_view path) {
    std::string current;
    Node* node = &m_nodes[""];
    for (const auto& part : Registry::SplitKeyPath(path)) {
        std::string next = current.empty() ? Utils::StringUtils::ToUpperAscii(part)
                                           : current + "\\" + Utils::StringUtils::ToUpperAscii(part);
        auto it = m_nodes.find(next);
        if (it == m_nodes.end()) {
            m_nodes[current].subkeys.push_back(part);
            Node fresh;
            fresh.name = part;
            it = m_nodes.emplace(next, std::move(fresh)).first;
        }
        node = &it->second;
        current = std::move(next);
    }
    return *node;
}

FakeHive& FakeHive::SetClass(std::string_view path, std::vector<uint8_t> className) {
    AddKey(path).className = std::move(className);
    return *this;
}

FakeHive& FakeHive::SetValue(std::string_view path, std::string_view name, std::vector<uint8_t> data,
                             Registry::ValueType type) {
    Node& node = AddKey(path);
    Registry::HiveValue value{ std::string(name), type, std::move(data) };
    for (auto& existing : node.values) {
        if (Utils::StringUtils::EqualsIgnoreCaseAscii(existing.name, name)) {
            existing = std::move(value);
            return *this;
        }
    }
    node.values.push_back(std::move(value));
    return *this;
}

std::unique_ptr<Registry::HiveKey> FakeHive::OpenKey(std::string_view path, Registry::Error* err) const {
    const auto it = m_nodes.find(Normalize(path));
    if (it == m_nodes.end()) {
        if (err) err->Set(Registry::ErrorCode::KeyNotFound, L"Key not found",
                          Utils::StringUtils::ToWide(path));
        return nullptr;
    }
    return std::make_unique<FakeKey>(it->second);
}

}  // namespace Testing
}  // namespace SamAudit
