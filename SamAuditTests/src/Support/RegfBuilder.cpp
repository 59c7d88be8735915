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
#include "RegfBuilder.hpp"

#include "TestBytes.hpp"

#include "Registry/RegistryHive.hpp"
#include "Utils/StringUtils.hpp"

#include <fstream>

namespace SamAudit {
namespace Testing {

namespace {

    constexpr size_t BASE_BLOCK = 4096;
    constexpr size_t HBIN_HEADER = 0x20;
    constexpr uint32_t NONE = 0xFFFFFFFFu;
    constexpr uint32_t SEGMENT = 16344;

    std::string Upper(std::string_view s) {
        return Utils::StringUtils::ToUpperAscii(s);
    }

}  // namespace

RegfBuilder::RegfBuilder() : RegfBuilder(Options{}) {}

RegfBuilder::RegfBuilder(Options options) : m_options(options) {
    m_root.name = "ROOT";
}

RegfBuilder::Node& RegfBuilder::Find(std::string_view path) {
    Node* node = &m_root;
    std::string walked;
    for (const auto& part : Registry::SplitKeyPath(path)) {
        if (!walked.empty()) walked.push_back('\\');
        walked += part;
        Node* next = nullptr;
        for (auto& child : node->children) {
            if (Upper(child->name) == Upper(part)) {
                next = child.get();
                break;
            }
        }
        if (!next) {
            auto fresh = std::make_unique<Node>();
            fresh->name = part;
            fresh->path = walked;
            next = fresh.get();
            node->children.push_back(std::move(fresh));
        }
        node = next;
    }
    return *node;
}

RegfBuilder& RegfBuilder::AddKey(std::string_view path) {
    Find(path);
    return *this;
}

RegfBuilder& RegfBuilder::SetClass(std::string_view path, std::vector<uint8_t> className) {
    Find(path).className = std::move(className);
    return *this;
}

RegfBuilder& RegfBuilder::SetValue(std::string_view path, std::string_view name, std::vector<uint8_t> data,
                                   uint32_t type) {
    Find(path).values.push_back(Value{ std::string(name), type, std::move(data) });
    return *this;
}

uint32_t RegfBuilder::Alloc(const std::vector<uint8_t>& payload) {
    const size_t cellSize = (payload.size() + 4 + 7) & ~static_cast<size_t>(7);
    const uint32_t offset = static_cast<uint32_t>(m_bins.size());
    m_bins.resize(m_bins.size() + cellSize, 0);
    PutU32(m_bins, offset, static_cast<uint32_t>(-static_cast<int32_t>(cellSize)));
    std::copy(payload.begin(), payload.end(), m_bins.begin() + offset + 4);
    return offset;
}

void RegfBuilder::Patch(uint32_t cell, size_t field, uint32_t v) {
    PutU32(m_bins, cell + 4 + field, v);
}

std::vector<uint8_t> RegfBuilder::EncodeName(const std::string& name) const {
    if (m_options.utf16Names) return Utf16(name);
    return std::vector<uint8_t>(name.begin(), name.end());
}

uint32_t RegfBuilder::EmitIndex(const std::vector<uint32_t>& children, const std::vector<std::string>& names) {
    auto list = [&](char s0, char s1, size_t from, size_t to, bool hashes) {
        std::vector<uint8_t> cell(4 + (to - from) * (hashes ? 8 : 4), 0);
        cell[0] = static_cast<uint8_t>(s0);
        cell[1] = static_cast<uint8_t>(s1);
        PutU16(cell, 2, static_cast<uint16_t>(to - from));
        for (size_t i = from; i < to; ++i) {
            const size_t pos = 4 + (i - from) * (hashes ? 8 : 4);
            PutU32(cell, pos, children[i]);
            if (hashes) {
                for (size_t c = 0; c < 4 && c < names[i].size(); ++c) {
                    cell[pos + 4 + c] = static_cast<uint8_t>(names[i][c]);
                }
            }
        }
        return Alloc(cell);
    };

    switch (m_options.index) {
    case IndexKind::LF: return list('l', 'f', 0, children.size(), true);
    case IndexKind::LH: return list('l', 'h', 0, children.size(), true);
    case IndexKind::LI: return list('l', 'i', 0, children.size(), false);
    case IndexKind::RI: {
        const size_t half = (children.size() + 1) / 2;
        std::vector<uint32_t> leaves;
        leaves.push_back(list('l', 'i', 0, half, false));
        if (half < children.size()) leaves.push_back(list('l', 'h', half, children.size(), true));
        std::vector<uint8_t> ri(4 + leaves.size() * 4, 0);
        ri[0] = 'r';
        ri[1] = 'i';
        PutU16(ri, 2, static_cast<uint16_t>(leaves.size()));
        for (size_t i = 0; i < leaves.size(); ++i) PutU32(ri, 4 + i * 4, leaves[i]);
        return Alloc(ri);
    }
    }
    return NONE;
}

uint32_t RegfBuilder::EmitValue(const Value& value) {
    const auto name = EncodeName(value.name);
    std::vector<uint8_t> vk(0x14 + name.size(), 0);
    vk[0] = 'v';
    vk[1] = 'k';
    PutU16(vk, 0x02, static_cast<uint16_t>(name.size()));
    PutU32(vk, 0x0C, value.type);
    PutU16(vk, 0x10, m_options.utf16Names ? 0 : 1);
    std::copy(name.begin(), name.end(), vk.begin() + 0x14);

    const uint32_t size = static_cast<uint32_t>(value.data.size());
    if (size <= 4) {
        PutU32(vk, 0x04, size | 0x80000000u);
        std::copy(value.data.begin(), value.data.end(), vk.begin() + 0x08);
        return Alloc(vk);
    }

    uint32_t dataCell = 0;
    if (size > SEGMENT) {
        std::vector<uint32_t> segments;
        for (size_t pos = 0; pos < value.data.size(); pos += SEGMENT) {
            const size_t end = std::min<size_t>(pos + SEGMENT, value.data.size());
            segments.push_back(Alloc(std::vector<uint8_t>(value.data.begin() + pos, value.data.begin() + end)));
        }
        std::vector<uint8_t> segList(segments.size() * 4, 0);
        for (size_t i = 0; i < segments.size(); ++i) PutU32(segList, i * 4, segments[i]);
        const uint32_t listCell = Alloc(segList);

        std::vector<uint8_t> db(8, 0);
        db[0] = 'd';
        db[1] = 'b';
        PutU16(db, 2, static_cast<uint16_t>(segments.size()));
        PutU32(db, 4, listCell);
        dataCell = Alloc(db);
    }
    else {
        dataCell = Alloc(value.data);
    }
    PutU32(vk, 0x04, size);
    PutU32(vk, 0x08, dataCell);
    return Alloc(vk);
}

uint32_t RegfBuilder::EmitKey(const Node& node, uint32_t parent, bool root) {
    const auto name = EncodeName(node.name);
    std::vector<uint8_t> nk(0x4C + name.size(), 0);
    nk[0] = 'n';
    nk[1] = 'k';
    uint16_t flags = root ? 0x0C : 0x00;
    if (!m_options.utf16Names) flags |= 0x20;
    PutU16(nk, 0x02, flags);
    PutU32(nk, 0x10, parent);
    PutU32(nk, 0x14, static_cast<uint32_t>(node.children.size()));
    PutU32(nk, 0x1C, NONE);
    PutU32(nk, 0x20, NONE);
    PutU32(nk, 0x24, static_cast<uint32_t>(node.values.size()));
    PutU32(nk, 0x28, NONE);
    PutU32(nk, 0x2C, NONE);
    PutU32(nk, 0x30, NONE);
    PutU16(nk, 0x48, static_cast<uint16_t>(name.size()));
    PutU16(nk, 0x4A, static_cast<uint16_t>(node.className.size()));
    std::copy(name.begin(), name.end(), nk.begin() + 0x4C);
    const uint32_t self = Alloc(nk);
    m_offsets[Upper(node.path)] = self;

    if (!node.className.empty()) {
        Patch(self, 0x30, Alloc(node.className));
    }

    if (!node.values.empty()) {
        std::vector<uint8_t> list(node.values.size() * 4, 0);
        for (size_t i = 0; i < node.values.size(); ++i) {
            PutU32(list, i * 4, EmitValue(node.values[i]));
        }
        Patch(self, 0x28, Alloc(list));
    }

    if (!node.children.empty()) {
        std::vector<uint32_t> offsets;
        std::vector<std::string> names;
        for (const auto& child : node.children) {
            offsets.push_back(EmitKey(*child, self, false));
            names.push_back(child->name);
        }
        Patch(self, 0x1C, EmitIndex(offsets, names));
    }
    return self;
}

std::vector<uint8_t> RegfBuilder::Build() {
    m_bins.assign(HBIN_HEADER, 0);
    m_offsets.clear();
    const uint32_t root = EmitKey(m_root, NONE, true);

    // Pad the bin to a page boundary with one free cell
    const size_t padded = (m_bins.size() + 8 + 4095) & ~static_cast<size_t>(4095);
    const size_t freeSize = padded - m_bins.size();
    const size_t freePos = m_bins.size();
    m_bins.resize(padded, 0);
    PutU32(m_bins, freePos, static_cast<uint32_t>(freeSize));

    m_bins[0] = 'h';
    m_bins[1] = 'b';
    m_bins[2] = 'i';
    m_bins[3] = 'n';
    PutU32(m_bins, 0x04, 0);
    PutU32(m_bins, 0x08, static_cast<uint32_t>(m_bins.size()));

    std::vector<uint8_t> image(BASE_BLOCK, 0);
    image[0] = 'r';
    image[1] = 'e';
    image[2] = 'g';
    image[3] = 'f';
    PutU32(image, 0x04, 7);
    PutU32(image, 0x08, m_options.dirty ? 6 : 7);
    PutU32(image, 0x14, 1);
    PutU32(image, 0x18, m_options.minorVersion);
    PutU32(image, 0x20, 1);
    PutU32(image, ROOT_CELL_FIELD, root);
    PutU32(image, 0x28, static_cast<uint32_t>(m_bins.size()));
    PutU32(image, 0x2C, 1);
    const auto fileName = Utf16("\\SystemRoot\\System32\\Config\\TEST");
    std::copy(fileName.begin(), fileName.end(), image.begin() + 0x30);

    uint32_t checksum = 0;
    for (size_t i = 0; i < CHECKSUM_OFFSET; i += 4) {
        checksum ^= static_cast<uint32_t>(image[i]) | (static_cast<uint32_t>(image[i + 1]) << 8) |
                    (static_cast<uint32_t>(image[i + 2]) << 16) | (static_cast<uint32_t>(image[i + 3]) << 24);
    }
    if (checksum == 0xFFFFFFFFu) checksum = 0xFFFFFFFEu;
    else if (checksum == 0) checksum = 1;
    PutU32(image, CHECKSUM_OFFSET, m_options.badChecksum ? checksum ^ 0x5A5A5A5Au : checksum);

    image.insert(image.end(), m_bins.begin(), m_bins.end());
    return image;
}

void RegfBuilder::WriteTo(const std::filesystem::path& path) {
    const auto image = Build();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(image.data()), static_cast<std::streamsize>(image.size()));
    if (!out) throw std::runtime_error("cannot write test hive " + path.string());
}

uint32_t RegfBuilder::KeyOffset(std::string_view path) const {
    const auto it = m_offsets.find(Upper(path));
    if (it == m_offsets.end()) throw std::out_of_range("no such key in built hive");
    return it->second;
}

}  // namespace Testing
}  // namespace SamAudit
