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

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Testing {

/**
 * @brief Serializes a key tree into a REGF hive image
 *
 * All cells go into one hive bin. Cell offsets are relative to the end of
 * the base block, as in real hives.
 */
class RegfBuilder {
public:
    enum class IndexKind { LF, LH, LI, RI };

    struct Options {
        IndexKind index = IndexKind::LF;
        bool utf16Names = false;        ///< Store names uncompressed
        bool dirty = false;             ///< Sequence numbers differ
        bool badChecksum = false;
        uint32_t minorVersion = 5;
    };

    RegfBuilder();
    explicit RegfBuilder(Options options);

    RegfBuilder& AddKey(std::string_view path);
    RegfBuilder& SetClass(std::string_view path, std::vector<uint8_t> className);
    RegfBuilder& SetValue(std::string_view path, std::string_view name, std::vector<uint8_t> data,
                          uint32_t type = 3);

    /// Produce the hive image; records cell offsets for KeyOffset()
    std::vector<uint8_t> Build();

    /// Write the image to a file
    void WriteTo(const std::filesystem::path& path);

    /// nk cell offset of a key from the last Build()
    uint32_t KeyOffset(std::string_view path) const;

    /// Offset of the base block checksum field
    static constexpr size_t CHECKSUM_OFFSET = 0x1FC;
    static constexpr size_t ROOT_CELL_FIELD = 0x24;

private:
    struct Value {
        std::string name;
        uint32_t type = 0;
        std::vector<uint8_t> data;
    };

    struct Node {
        std::string name;
        std::string path;
        std::vector<uint8_t> className;
        std::vector<std::unique_ptr<Node>> children;
        std::vector<Value> values;
    };

    Node& Find(std::string_view path);
    uint32_t Alloc(const std::vector<uint8_t>& payload);
    void Patch(uint32_t cell, size_t field, uint32_t v);
    std::vector<uint8_t> EncodeName(const std::string& name) const;
    uint32_t EmitKey(const Node& node, uint32_t parent, bool root);
    uint32_t EmitIndex(const std::vector<uint32_t>& children, const std::vector<std::string>& names);
    uint32_t EmitValue(const Value& value);

    Options m_options;
    Node m_root;
    std::vector<uint8_t> m_bins;
    std::map<std::string, uint32_t> m_offsets;
};

}  // namespace Testing
}  // namespace SamAudit
