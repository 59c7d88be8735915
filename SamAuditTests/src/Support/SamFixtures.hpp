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

#include "TestBytes.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Testing {

/**
 * Known-answer material for the SAM pipeline.
 *
 * The SYSTEM class names descramble to bootkey 8893ae934513bddd254735163e9d3300.
 * With it the revision 1 domain F yields key 3d212ce8a2da8343bdad1ef2cfb6b31c
 * and the revision 2 domain F yields fcdee83ac6c14b28f526501fc6e8bbc3.
 */
namespace Fixtures {

    inline constexpr std::string_view JD_CLASS = "253593dd";
    inline constexpr std::string_view SKEW1_CLASS = "ae934700";
    inline constexpr std::string_view GBG_CLASS = "88139d45";
    inline constexpr std::string_view DATA_CLASS = "16bd3e33";
    inline constexpr std::string_view BOOT_KEY_HEX = "8893ae934513bddd254735163e9d3300";

    inline constexpr std::string_view DOMAIN_F_RC4_HEX =
        "020001000000000040153b97469fce0126000000000000000080a60affdeffff0000000000000000"
        "000000000000008000cc1dcffbffffff00cc1dcffbffffff0000000000000000e903000001000000"
        "0000000000000000010000000300000001000000000001000100000038000000237ee912a734bf93"
        "186eaac1830759a1d696a6996ba941614492b0fbd00ae9a637d67cc6992bc712fe22a01771ced3aa"
        "000000000000000001000000380000003dfee0d720eb39c1441c8d0529d6834792a22938fc9ea729"
        "a9367d4afc6ce1b3d3acd4ace25babf9f83f09e1911a7dda00000000000000000300000000000000";
    inline constexpr std::string_view DERIVED_KEY_RC4_HEX = "3d212ce8a2da8343bdad1ef2cfb6b31c";

    /// Follows 0x68 zero bytes in the revision 2 domain F
    inline constexpr std::string_view DOMAIN_KEY_AES_HEX =
        "02000000400000001000000020000000000102030405060708090a0b0c0d0e0f"
        "0b3cc6479919e408aa39565bcb9939127c6bea6f6f29c9afe56770bdef1ef1e5";
    inline constexpr std::string_view DERIVED_KEY_AES_HEX = "fcdee83ac6c14b28f526501fc6e8bbc3";

    // Administrator (RID 500)
    inline constexpr uint32_t ADMIN_RID = 0x1F4;
    inline constexpr std::string_view ADMIN_NT_HEX = "58A478135A93AC3BF058A5EA0E8FDB71";
    inline constexpr std::string_view ADMIN_NT_RC4_ENC = "ED928792783B692C213749BCDBE31AF5";
    inline constexpr std::string_view ADMIN_NT_AES_IV = "2B7E151628AED2A6ABF7158809CF4F3C";
    inline constexpr std::string_view ADMIN_NT_AES_ENC =
        "3C7D6601C8F19A89866FC9E718AA2C31145AE7F70E01DDFBF7C3AF70994BEF3E";

    // alice (RID 1001), password "password"
    inline constexpr uint32_t ALICE_RID = 0x3E9;
    inline constexpr std::string_view ALICE_LM_HEX = "E52CAC67419A9A224A3B108F3FA6CB6D";
    inline constexpr std::string_view ALICE_NT_HEX = "8846F7EAEE8FB117AD06BDD830B7586C";
    inline constexpr std::string_view ALICE_LM_RC4_ENC = "0c4b53df15edf9ebf335009c3e7589d2";
    inline constexpr std::string_view ALICE_NT_RC4_ENC = "140a0c6372e94e7e43e0e03c8713f9b7";
    inline constexpr std::string_view ALICE_NT_AES_IV = "101112131415161718191a1b1c1d1e1f";
    inline constexpr std::string_view ALICE_NT_AES_ENC =
        "e748c6b76bf8aca41df3707ee2aa209e5394ac51a83d9977e8b6e02947ccb550";

    enum class Revision { RC4, AES };

    [[nodiscard]] std::vector<uint8_t> DomainF(Revision revision);

    /// User F record with the disabled bit set or clear
    [[nodiscard]] std::vector<uint8_t> UserF(bool disabled);

    /// User V record; empty blobs produce zero-length entries
    [[nodiscard]] std::vector<uint8_t> UserV(std::string_view username, const std::vector<uint8_t>& lmBlob,
                                             const std::vector<uint8_t>& ntBlob);

    [[nodiscard]] std::vector<uint8_t> Rc4Blob(std::string_view encryptedHex);
    [[nodiscard]] std::vector<uint8_t> AesBlob(std::string_view ivHex, std::string_view encryptedHex);

    /// Registry key name of a RID ("000001F4")
    [[nodiscard]] std::string RidKey(uint32_t rid);

    /// Populate Select and the LSA class names (FakeHive or RegfBuilder)
    template <typename Builder>
    void PopulateSystem(Builder& b, uint32_t controlSet = 1) {
        b.SetValue("Select", "Current", U32(controlSet));
        char lsa[48] = {};
        std::snprintf(lsa, sizeof(lsa), "ControlSet%03u\\Control\\Lsa\\", controlSet);
        b.SetClass(std::string(lsa) + "JD", Utf16(JD_CLASS));
        b.SetClass(std::string(lsa) + "Skew1", Utf16(SKEW1_CLASS));
        b.SetClass(std::string(lsa) + "GBG", Utf16(GBG_CLASS));
        b.SetClass(std::string(lsa) + "Data", Utf16(DATA_CLASS));
    }

    template <typename Builder>
    void PopulateDomain(Builder& b, Revision revision) {
        b.SetValue("SAM\\Domains\\Account", "F", DomainF(revision));
        b.AddKey("SAM\\Domains\\Account\\Users\\Names");
    }

    template <typename Builder>
    void AddUser(Builder& b, uint32_t rid, std::string_view name, bool disabled,
                 const std::vector<uint8_t>& lmBlob, const std::vector<uint8_t>& ntBlob) {
        const std::string key = "SAM\\Domains\\Account\\Users\\" + RidKey(rid);
        b.SetValue(key, "F", UserF(disabled));
        b.SetValue(key, "V", UserV(name, lmBlob, ntBlob));
        b.AddKey("SAM\\Domains\\Account\\Users\\Names\\" + std::string(name));
    }

    /// Administrator and alice, both enabled, encrypted for the given revision
    template <typename Builder>
    void PopulateSam(Builder& b, Revision revision) {
        PopulateDomain(b, revision);
        if (revision == Revision::RC4) {
            AddUser(b, ADMIN_RID, "Administrator", false, {}, Rc4Blob(ADMIN_NT_RC4_ENC));
            AddUser(b, ALICE_RID, "alice", false, Rc4Blob(ALICE_LM_RC4_ENC), Rc4Blob(ALICE_NT_RC4_ENC));
        }
        else {
            AddUser(b, ADMIN_RID, "Administrator", false, {}, AesBlob(ADMIN_NT_AES_IV, ADMIN_NT_AES_ENC));
            AddUser(b, ALICE_RID, "alice", false, {}, AesBlob(ALICE_NT_AES_IV, ALICE_NT_AES_ENC));
        }
    }

}  // namespace Fixtures
}  // namespace Testing
}  // namespace SamAudit
