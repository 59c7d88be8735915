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
#include "HiveParser.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <cstring>

namespace SamAudit {
namespace Registry {

using namespace RegfConstants;

namespace {

    // Base block field offsets
    constexpr size_t BB_PRIMARY_SEQ = 0x04;
    constexpr size_t BB_SECONDARY_SEQ = 0x08;
    constexpr size_t BB_MAJOR = 0x14;
    constexpr size_t BB_MINOR = 0x18;
    constexpr size_t BB_ROOT_CELL = 0x24;
    constexpr size_t BB_BINS_SIZE = 0x28;
    constexpr size_t BB_FILE_NAME = 0x30;
    constexpr size_t BB_FILE_NAME_LEN = 64;
    constexpr size_t BB_CHECKSUM = 0x1FC;

    // nk offsets (relative to cell payload, i.e. after the size field)
    constexpr size_t NK_FLAGS = 0x02;
    constexpr size_t NK_SUBKEY_COUNT = 0x14;
    constexpr size_t NK_SUBKEY_LIST = 0x1C;
    constexpr size_t NK_VALUE_COUNT = 0x24;
    constexpr size_t NK_VALUE_LIST = 0x28;
    constexpr size_t NK_CLASS_OFFSET = 0x30;
    constexpr size_t NK_NAME_LEN = 0x48;
    constexpr size_t NK_CLASS_LEN = 0x4A;
    constexpr size_t NK_NAME = 0x4C;

    // vk offsets (relative to cell payload)
    constexpr size_t VK_NAME_LEN = 0x02;
    constexpr size_t VK_DATA_SIZE = 0x04;
    constexpr size_t VK_DATA_OFFSET = 0x08;
    constexpr size_t VK_TYPE = 0x0C;
    constexpr size_t VK_FLAGS = 0x10;
    constexpr size_t VK_NAME = 0x14;

    [[nodiscard]] uint16_t ReadU16(const uint8_t* p) noexcept {
        return static_cast<uint16_t>(p[0] | (p[1] << 8));
    }

    [[nodiscard]] uint32_t ReadU32(const uint8_t* p) noexcept {
        return static_cast<uint32_t>(p[0]) |
               (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) |
               (static_cast<uint32_t>(p[3]) << 24);
    }

    /// Cell payload view (size field excluded)
    struct CellView {
        const uint8_t* data = nullptr;
        size_t size = 0;

        [[nodiscard]] bool Has(size_t offset, size_t len) const noexcept {
            return offset <= size && len <= size - offset;
        }
    };

    struct KeyNode {
        uint16_t flags = 0;
        uint32_t subkeyCount = 0;
        uint32_t subkeyList = INVALID_OFFSET;
        uint32_t valueCount = 0;
        uint32_t valueList = INVALID_OFFSET;
        uint32_t classOffset = INVALID_OFFSET;
        uint16_t classLength = 0;
        std::string name;
    };

    struct ValueNode {
        std::string name;
        uint32_t rawSize = 0;
        uint32_t dataOffset = 0;
        uint32_t type = 0;
        uint8_t residentBytes[4] = {};
    };

    std::wstring HexOffset(uint32_t offset) {
        wchar_t buf[16] = {};
        std::swprintf(buf, 16, L"0x%08X", offset);
        return buf;
    }

}  // namespace

// ============================================================================
// IMPLEMENTATION CLASS
// ============================================================================

class HiveParserImpl {
public:
    std::vector<uint8_t> image;
    HiveInfo info;

    [[nodiscard]] bool ParseBaseBlock(Error* err);

    [[nodiscard]] bool Cell(uint32_t offset, CellView& out, Error* err) const;
    [[nodiscard]] bool ReadKeyNode(uint32_t offset, KeyNode& out, Error* err) const;
    [[nodiscard]] bool CollectSubkeys(uint32_t listOffset, std::vector<uint32_t>& out,
                                      uint32_t depth, Error* err) const;
    [[nodiscard]] bool ReadValueList(const KeyNode& nk, std::vector<uint32_t>& out, Error* err) const;
    [[nodiscard]] bool ReadValueNode(uint32_t offset, ValueNode& out, Error* err) const;
    [[nodiscard]] bool ReadValueData(const ValueNode& vk, std::vector<uint8_t>& out, Error* err) const;
    [[nodiscard]] bool ReadClassName(const KeyNode& nk, std::vector<uint8_t>& out, Error* err) const;
};

namespace {

    bool Corrupt(Error* err, std::wstring_view msg, uint32_t offset) {
        if (err) err->Set(ErrorCode::CorruptHive, msg, HexOffset(offset));
        SA_LOG_DEBUG(L"HiveParser", L"Corrupt hive: %.*ls at %ls",
                     static_cast<int>(msg.size()), msg.data(), HexOffset(offset).c_str());
        return false;
    }

    std::string DecodeName(const uint8_t* p, size_t len, bool compressed) {
        const std::span<const uint8_t> bytes(p, len);
        return compressed ? Utils::StringUtils::Latin1ToUtf8(bytes)
                          : Utils::StringUtils::Utf16LeToUtf8(bytes, false);
    }

}  // namespace

bool HiveParserImpl::ParseBaseBlock(Error* err) {
    if (image.size() < BASE_BLOCK_SIZE || std::memcmp(image.data(), "regf", 4) != 0) {
        if (err) err->Set(ErrorCode::NotAHive, L"File does not have registry magic.");
        return false;
    }

    const uint8_t* bb = image.data();
    info.primarySequence = ReadU32(bb + BB_PRIMARY_SEQ);
    info.secondarySequence = ReadU32(bb + BB_SECONDARY_SEQ);
    info.majorVersion = ReadU32(bb + BB_MAJOR);
    info.minorVersion = ReadU32(bb + BB_MINOR);
    info.rootCellOffset = ReadU32(bb + BB_ROOT_CELL);
    info.hiveBinsSize = ReadU32(bb + BB_BINS_SIZE);
    info.dirty = info.primarySequence != info.secondarySequence;
    info.embeddedFileName = DecodeName(bb + BB_FILE_NAME, BB_FILE_NAME_LEN, false);
    const auto nul = info.embeddedFileName.find('\0');
    if (nul != std::string::npos) info.embeddedFileName.resize(nul);

    uint32_t checksum = 0;
    for (size_t i = 0; i < BB_CHECKSUM; i += 4) {
        checksum ^= ReadU32(bb + i);
    }
    if (checksum == 0xFFFFFFFFu) checksum = 0xFFFFFFFEu;
    else if (checksum == 0) checksum = 1;
    info.checksumValid = checksum == ReadU32(bb + BB_CHECKSUM);

    if (!info.checksumValid) {
        SA_LOG_WARN(L"HiveParser", L"Base block checksum mismatch");
    }
    if (info.dirty) {
        SA_LOG_WARN(L"HiveParser", L"Hive is dirty (sequence %u != %u); transaction logs are not replayed",
                    info.primarySequence, info.secondarySequence);
    }
    if (BASE_BLOCK_SIZE + static_cast<uint64_t>(info.hiveBinsSize) > image.size()) {
        SA_LOG_WARN(L"HiveParser", L"Hive bins size %u exceeds image (%zu bytes); hive may be truncated",
                    info.hiveBinsSize, image.size());
    }

    KeyNode rootNode;
    if (!ReadKeyNode(info.rootCellOffset, rootNode, err)) {
        if (err && err->code == ErrorCode::CorruptHive) {
            err->message = L"Root key cell is invalid";
        }
        return false;
    }
    return true;
}

bool HiveParserImpl::Cell(uint32_t offset, CellView& out, Error* err) const {
    if (offset == INVALID_OFFSET) {
        return Corrupt(err, L"Reference to missing cell", offset);
    }
    const uint64_t pos = BASE_BLOCK_SIZE + static_cast<uint64_t>(offset);
    if (pos + 4 > image.size()) {
        return Corrupt(err, L"Cell offset outside image", offset);
    }
    const int32_t rawSize = static_cast<int32_t>(ReadU32(image.data() + pos));
    // Allocated cells carry a negative size.
    if (rawSize >= 0) {
        return Corrupt(err, L"Reference to free cell", offset);
    }
    const uint64_t cellSize = static_cast<uint64_t>(-static_cast<int64_t>(rawSize));
    if (cellSize < 4 || pos + cellSize > image.size()) {
        return Corrupt(err, L"Cell extends past image", offset);
    }
    out.data = image.data() + pos + 4;
    out.size = static_cast<size_t>(cellSize - 4);
    return true;
}

bool HiveParserImpl::ReadKeyNode(uint32_t offset, KeyNode& out, Error* err) const {
    CellView cell;
    if (!Cell(offset, cell, err)) return false;
    if (!cell.Has(0, NK_NAME) || cell.data[0] != 'n' || cell.data[1] != 'k') {
        return Corrupt(err, L"Expected key node (nk)", offset);
    }

    out.flags = ReadU16(cell.data + NK_FLAGS);
    out.subkeyCount = ReadU32(cell.data + NK_SUBKEY_COUNT);
    out.subkeyList = ReadU32(cell.data + NK_SUBKEY_LIST);
    out.valueCount = ReadU32(cell.data + NK_VALUE_COUNT);
    out.valueList = ReadU32(cell.data + NK_VALUE_LIST);
    out.classOffset = ReadU32(cell.data + NK_CLASS_OFFSET);
    out.classLength = ReadU16(cell.data + NK_CLASS_LEN);

    const uint16_t nameLen = ReadU16(cell.data + NK_NAME_LEN);
    if (!cell.Has(NK_NAME, nameLen)) {
        return Corrupt(err, L"Key name exceeds cell", offset);
    }
    out.name = DecodeName(cell.data + NK_NAME, nameLen, (out.flags & KEY_COMP_NAME) != 0);
    return true;
}

bool HiveParserImpl::CollectSubkeys(uint32_t listOffset, std::vector<uint32_t>& out,
                                    uint32_t depth, Error* err) const {
    if (depth > MAX_INDEX_DEPTH) {
        return Corrupt(err, L"Subkey index nesting too deep", listOffset);
    }
    CellView cell;
    if (!Cell(listOffset, cell, err)) return false;
    if (!cell.Has(0, 4)) {
        return Corrupt(err, L"Subkey index too small", listOffset);
    }

    const char sig0 = static_cast<char>(cell.data[0]);
    const char sig1 = static_cast<char>(cell.data[1]);
    const uint16_t count = ReadU16(cell.data + 2);

    size_t stride = 0;
    if ((sig0 == 'l' && sig1 == 'f') || (sig0 == 'l' && sig1 == 'h')) {
        stride = 8;     // offset + hash
    }
    else if ((sig0 == 'l' && sig1 == 'i') || (sig0 == 'r' && sig1 == 'i')) {
        stride = 4;
    }
    else {
        return Corrupt(err, L"Unknown subkey index signature", listOffset);
    }

    if (!cell.Has(4, static_cast<size_t>(count) * stride)) {
        return Corrupt(err, L"Subkey index entries exceed cell", listOffset);
    }

    for (uint16_t i = 0; i < count; ++i) {
        const uint32_t entry = ReadU32(cell.data + 4 + static_cast<size_t>(i) * stride);
        if (sig0 == 'r') {
            if (!CollectSubkeys(entry, out, depth + 1, err)) return false;
        }
        else {
            out.push_back(entry);
        }
    }
    return true;
}

bool HiveParserImpl::ReadValueList(const KeyNode& nk, std::vector<uint32_t>& out, Error* err) const {
    out.clear();
    if (nk.valueCount == 0) return true;

    CellView cell;
    if (!Cell(nk.valueList, cell, err)) return false;
    if (!cell.Has(0, static_cast<size_t>(nk.valueCount) * 4)) {
        return Corrupt(err, L"Value list exceeds cell", nk.valueList);
    }
    out.reserve(nk.valueCount);
    for (uint32_t i = 0; i < nk.valueCount; ++i) {
        out.push_back(ReadU32(cell.data + static_cast<size_t>(i) * 4));
    }
    return true;
}

bool HiveParserImpl::ReadValueNode(uint32_t offset, ValueNode& out, Error* err) const {
    CellView cell;
    if (!Cell(offset, cell, err)) return false;
    if (!cell.Has(0, VK_NAME) || cell.data[0] != 'v' || cell.data[1] != 'k') {
        return Corrupt(err, L"Expected value node (vk)", offset);
    }

    const uint16_t nameLen = ReadU16(cell.data + VK_NAME_LEN);
    const uint16_t flags = ReadU16(cell.data + VK_FLAGS);
    if (!cell.Has(VK_NAME, nameLen)) {
        return Corrupt(err, L"Value name exceeds cell", offset);
    }

    out.rawSize = ReadU32(cell.data + VK_DATA_SIZE);
    out.dataOffset = ReadU32(cell.data + VK_DATA_OFFSET);
    out.type = ReadU32(cell.data + VK_TYPE);
    std::memcpy(out.residentBytes, cell.data + VK_DATA_OFFSET, 4);
    out.name = DecodeName(cell.data + VK_NAME, nameLen, (flags & VALUE_COMP_NAME) != 0);
    return true;
}

bool HiveParserImpl::ReadValueData(const ValueNode& vk, std::vector<uint8_t>& out, Error* err) const {
    out.clear();

    if (vk.rawSize & DATA_IS_RESIDENT) {
        const uint32_t len = vk.rawSize & ~DATA_IS_RESIDENT;
        if (len > 4) {
            return Corrupt(err, L"Resident value larger than 4 bytes", vk.dataOffset);
        }
        out.assign(vk.residentBytes, vk.residentBytes + len);
        return true;
    }

    const uint32_t len = vk.rawSize;
    if (len == 0) return true;

    CellView cell;
    if (!Cell(vk.dataOffset, cell, err)) return false;

    const bool bigData = len > BIG_DATA_THRESHOLD && info.minorVersion >= 4 &&
                         cell.Has(0, 8) && cell.data[0] == 'd' && cell.data[1] == 'b';
    if (!bigData) {
        if (!cell.Has(0, len)) {
            return Corrupt(err, L"Value data exceeds cell", vk.dataOffset);
        }
        out.assign(cell.data, cell.data + len);
        return true;
    }

    const uint16_t segments = ReadU16(cell.data + 2);
    const uint32_t segListOffset = ReadU32(cell.data + 4);
    CellView segList;
    if (!Cell(segListOffset, segList, err)) return false;
    if (!segList.Has(0, static_cast<size_t>(segments) * 4)) {
        return Corrupt(err, L"Big data segment list exceeds cell", segListOffset);
    }

    out.reserve(len);
    for (uint16_t i = 0; i < segments && out.size() < len; ++i) {
        const uint32_t segOffset = ReadU32(segList.data + static_cast<size_t>(i) * 4);
        CellView seg;
        if (!Cell(segOffset, seg, err)) {
            out.clear();
            return false;
        }
        const size_t take = std::min<size_t>({ seg.size, static_cast<size_t>(BIG_DATA_THRESHOLD),
                                                len - out.size() });
        out.insert(out.end(), seg.data, seg.data + take);
    }
    if (out.size() != len) {
        out.clear();
        return Corrupt(err, L"Big data segments shorter than declared size", vk.dataOffset);
    }
    return true;
}

bool HiveParserImpl::ReadClassName(const KeyNode& nk, std::vector<uint8_t>& out, Error* err) const {
    out.clear();
    if (nk.classLength == 0 || nk.classOffset == INVALID_OFFSET) return true;

    CellView cell;
    if (!Cell(nk.classOffset, cell, err)) return false;
    if (!cell.Has(0, nk.classLength)) {
        return Corrupt(err, L"Class name exceeds cell", nk.classOffset);
    }
    out.assign(cell.data, cell.data + nk.classLength);
    return true;
}

// ============================================================================
// KEY
// ============================================================================

namespace {

    class ParsedKey final : public HiveKey {
    public:
        ParsedKey(std::shared_ptr<const HiveParserImpl> hive, KeyNode node,
                  std::vector<uint8_t> className, std::vector<std::string> subkeys) noexcept
            : m_hive(std::move(hive)),
              m_node(std::move(node)),
              m_className(std::move(className)),
              m_subkeys(std::move(subkeys)) {}

        const std::string& Name() const noexcept override { return m_node.name; }
        const std::vector<uint8_t>& ClassName() const noexcept override { return m_className; }
        const std::vector<std::string>& SubkeyNames() const noexcept override { return m_subkeys; }

        std::vector<std::string> ValueNames() const override {
            std::vector<std::string> names;
            std::vector<uint32_t> offsets;
            Error err;
            if (!m_hive->ReadValueList(m_node, offsets, &err)) {
                SA_LOG_WARN(L"HiveParser", L"Cannot read value list of '%ls': %ls",
                            Utils::StringUtils::ToWide(m_node.name).c_str(), err.message.c_str());
                return names;
            }
            names.reserve(offsets.size());
            for (const uint32_t off : offsets) {
                ValueNode vk;
                if (!m_hive->ReadValueNode(off, vk, &err)) {
                    SA_LOG_WARN(L"HiveParser", L"Skipping unreadable value at %ls", err.context.c_str());
                    continue;
                }
                names.push_back(std::move(vk.name));
            }
            return names;
        }

        bool GetValue(std::string_view name, HiveValue& out, Error* err) const override {
            std::vector<uint32_t> offsets;
            if (!m_hive->ReadValueList(m_node, offsets, err)) return false;

            for (const uint32_t off : offsets) {
                ValueNode vk;
                if (!m_hive->ReadValueNode(off, vk, err)) return false;
                if (!Utils::StringUtils::EqualsIgnoreCaseAscii(vk.name, name)) continue;

                HiveValue value;
                if (!m_hive->ReadValueData(vk, value.data, err)) return false;
                value.name = std::move(vk.name);
                value.type = static_cast<ValueType>(vk.type);
                out = std::move(value);
                return true;
            }

            if (err) {
                err->Set(ErrorCode::ValueNotFound, L"Value not found: " + Utils::StringUtils::ToWide(name),
                         Utils::StringUtils::ToWide(m_node.name));
            }
            return false;
        }

    private:
        std::shared_ptr<const HiveParserImpl> m_hive;
        KeyNode m_node;
        std::vector<uint8_t> m_className;
        std::vector<std::string> m_subkeys;
    };

}  // namespace

// ============================================================================
// HIVE PARSER
// ============================================================================

HiveParser::HiveParser(ConstructionKey, std::shared_ptr<const HiveParserImpl> impl) noexcept
    : m_impl(std::move(impl)) {}

HiveParser::~HiveParser() = default;

std::unique_ptr<HiveParser> HiveParser::Load(const std::filesystem::path& path, Error* err) {
    std::vector<uint8_t> bytes;
    Utils::FileUtils::Error ferr;
    if (!Utils::FileUtils::ReadAllBytes(path, bytes, &ferr)) {
        if (err) {
            err->Set(ErrorCode::IoError, Utils::StringUtils::ToWide(ferr.message), path.wstring());
        }
        return nullptr;
    }

    auto parser = FromBuffer(std::move(bytes), err);
    if (!parser) {
        if (err && err->context.empty()) err->context = path.wstring();
        return nullptr;
    }
    SA_LOG_INFO(L"HiveParser", L"Loaded hive %ls (%zu bytes, v%u.%u)", path.wstring().c_str(),
                parser->ImageSize(), parser->Info().majorVersion, parser->Info().minorVersion);
    return parser;
}

std::unique_ptr<HiveParser> HiveParser::FromBuffer(std::vector<uint8_t> image, Error* err) {
    auto impl = std::make_shared<HiveParserImpl>();
    impl->image = std::move(image);
    if (!impl->ParseBaseBlock(err)) {
        return nullptr;
    }
    return std::make_unique<HiveParser>(ConstructionKey{}, std::move(impl));
}

const HiveInfo& HiveParser::Info() const noexcept {
    return m_impl->info;
}

size_t HiveParser::ImageSize() const noexcept {
    return m_impl->image.size();
}

std::unique_ptr<HiveKey> HiveParser::OpenKey(std::string_view path, Error* err) const {
    const auto components = SplitKeyPath(path);

    KeyNode node;
    if (!m_impl->ReadKeyNode(m_impl->info.rootCellOffset, node, err)) return nullptr;

    std::vector<uint32_t> children;
    std::vector<std::string> walked;
    for (const auto& component : components) {
        children.clear();
        if (node.subkeyCount > 0 &&
            !m_impl->CollectSubkeys(node.subkeyList, children, 0, err)) {
            return nullptr;
        }

        bool found = false;
        for (const uint32_t child : children) {
            KeyNode candidate;
            if (!m_impl->ReadKeyNode(child, candidate, err)) return nullptr;
            if (Utils::StringUtils::EqualsIgnoreCaseAscii(candidate.name, component)) {
                node = std::move(candidate);
                found = true;
                break;
            }
        }
        walked.push_back(component);
        if (!found) {
            if (err) {
                std::string joined;
                for (const auto& part : walked) {
                    if (!joined.empty()) joined.push_back('\\');
                    joined += part;
                }
                err->Set(ErrorCode::KeyNotFound, L"Key not found",
                         Utils::StringUtils::ToWide(joined));
            }
            return nullptr;
        }
    }

    std::vector<uint8_t> className;
    if (!m_impl->ReadClassName(node, className, err)) return nullptr;

    children.clear();
    if (node.subkeyCount > 0 && !m_impl->CollectSubkeys(node.subkeyList, children, 0, err)) {
        return nullptr;
    }
    std::vector<std::string> subkeys;
    subkeys.reserve(children.size());
    for (const uint32_t child : children) {
        KeyNode sub;
        if (!m_impl->ReadKeyNode(child, sub, err)) return nullptr;
        subkeys.push_back(std::move(sub.name));
    }

    return std::make_unique<ParsedKey>(m_impl, std::move(node), std::move(className), std::move(subkeys));
}

}  // namespace Registry
}  // namespace SamAudit
