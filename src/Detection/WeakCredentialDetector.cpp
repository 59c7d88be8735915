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
#include "WeakCredentialDetector.hpp"

#include "../Registry/HiveParser.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/HashUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace SamAudit {
namespace Detection {

namespace {

    std::string Fingerprint(const std::filesystem::path& path) {
        std::vector<uint8_t> digest;
        Utils::HashUtils::Error herr;
        if (!Utils::HashUtils::ComputeFile(Utils::HashUtils::Algorithm::SHA256, path, digest, &herr)) {
            SA_LOG_WARN(L"Detector", L"Cannot fingerprint %ls: %ls", path.wstring().c_str(),
                        herr.message.c_str());
            return {};
        }
        return Utils::HashUtils::ToHexLower(digest);
    }

    /// Removes the hive copies on scope exit when requested
    class HiveCleanup {
    public:
        HiveCleanup(bool enabled, ScanReport& report,
                    std::filesystem::path sam, std::filesystem::path system) noexcept
            : m_enabled(enabled), m_report(report), m_sam(std::move(sam)), m_system(std::move(system)) {}

        ~HiveCleanup() {
            if (!m_enabled) return;
            m_report.sam.deleted = Remove(m_sam);
            m_report.system.deleted = Remove(m_system);
        }

        HiveCleanup(const HiveCleanup&) = delete;
        HiveCleanup& operator=(const HiveCleanup&) = delete;

    private:
        static bool Remove(const std::filesystem::path& path) noexcept {
            Utils::FileUtils::Error ferr;
            if (!Utils::FileUtils::RemoveFile(path, &ferr)) {
                SA_LOG_ERROR(L"Detector", L"Failed to delete hive copy %ls", path.wstring().c_str());
                return false;
            }
            SA_LOG_INFO(L"Detector", L"Deleted hive copy %ls", path.wstring().c_str());
            return true;
        }

        bool m_enabled;
        ScanReport& m_report;
        std::filesystem::path m_sam;
        std::filesystem::path m_system;
    };

}  // namespace

WeakCredentialDetector::WeakCredentialDetector(const HashDictionary& lmDictionary,
                                               const HashDictionary& ntDictionary) noexcept
    : m_lm(lmDictionary), m_nt(ntDictionary) {}

Finding WeakCredentialDetector::LmFormatFinding() {
    Finding f;
    f.reference = std::string(FINDING_LM_FORMAT);
    f.title = "Password hashes are stored in the LM format";
    f.severity = Severity::High;
    f.description = "Password hashes are stored in the LM format. Please switch local storage to "
                    "use NT format and regenerate the hashes.";
    f.recommendation = "Enable \"Network security: Do not store LAN Manager hash value on next "
                       "password change\", then change the password of the affected users.";
    return f;
}

Finding WeakCredentialDetector::WeakPasswordFinding() {
    Finding f;
    f.reference = std::string(FINDING_WEAK_PASSWORD);
    f.title = "Weak passwords on Windows";
    f.severity = Severity::Critical;
    f.description = "Some passwords were identified as being weak.";
    f.recommendation = "Change the password of the affected users.";
    return f;
}

bool WeakCredentialDetector::Crack(const Credentials::UserRecord& user, WeakCredential& out) const {
    if (!user.lmHash.empty()) {
        if (auto clear = m_lm.Lookup(user.LmHashHex())) {
            out = WeakCredential{ user.username, user.rid, Credentials::HashKind::LM, std::move(*clear) };
            return true;
        }
    }
    if (!user.ntHash.empty()) {
        if (auto clear = m_nt.Lookup(user.NtHashHex())) {
            out = WeakCredential{ user.username, user.rid, Credentials::HashKind::NT, std::move(*clear) };
            return true;
        }
    }
    return false;
}

std::vector<Finding> WeakCredentialDetector::Evaluate(const std::vector<Credentials::UserRecord>& users) const {
    std::vector<Finding> findings;

    Finding lm = LmFormatFinding();
    for (const auto& user : users) {
        if (!user.lmHash.empty()) lm.users.push_back(user.username);
    }
    if (!lm.users.empty()) {
        findings.push_back(std::move(lm));
    }

    Finding weak = WeakPasswordFinding();
    for (const auto& user : users) {
        WeakCredential hit;
        if (Crack(user, hit)) {
            weak.users.push_back(hit.username);
            weak.weak.push_back(std::move(hit));
        }
    }
    if (!weak.weak.empty()) {
        findings.push_back(std::move(weak));
    }
    return findings;
}

bool WeakCredentialDetector::ScanHives(const Registry::Hive& samHive, const Registry::Hive& systemHive,
                                       const DetectorOptions& options, ScanReport& report,
                                       Error* err) const {
    SA_LOG_SCOPE(L"Detector");

    Credentials::UserEnumerator enumerator(samHive, systemHive);
    Credentials::Error cerr;
    if (!enumerator.Prepare(&cerr)) {
        if (err) {
            err->Set(ErrorCode::ScanFatal, cerr.message, cerr.context);
            err->credentialCode = cerr.code;
        }
        return false;
    }

    Credentials::EnumerationResult result;
    const bool ok = enumerator.Enumerate(options.enumeration, result, &cerr);

    report.stats = result.stats;
    report.users.clear();
    report.userErrors.clear();
    for (auto& entry : result.users) {
        if (auto* user = std::get_if<Credentials::UserRecord>(&entry)) {
            report.users.push_back(std::move(*user));
        }
        else {
            report.userErrors.push_back(std::get<Credentials::UserError>(std::move(entry)));
        }
    }

    if (!ok) {
        if (err) {
            const bool userScoped = !Credentials::IsScanFatal(cerr.code);
            err->Set(userScoped ? ErrorCode::UserFailure : ErrorCode::ScanFatal, cerr.message, cerr.context);
            err->credentialCode = cerr.code;
        }
        return false;
    }

    report.findings = Evaluate(report.users);
    SA_LOG_INFO(L"Detector", L"Scan produced %zu findings", report.findings.size());
    return true;
}

bool WeakCredentialDetector::Scan(const std::filesystem::path& samPath,
                                  const std::filesystem::path& systemPath,
                                  const DetectorOptions& options, ScanReport& report,
                                  Error* err) const {
    report = ScanReport{};
    report.startedAt = std::chrono::system_clock::now();
    report.sam.path = samPath.string();
    report.system.path = systemPath.string();

    bool ok = false;
    {
        HiveCleanup cleanup(options.deleteHivesAfterScan, report, samPath, systemPath);

        report.sam.sha256 = Fingerprint(samPath);
        report.system.sha256 = Fingerprint(systemPath);

        Registry::Error rerr;
        auto system = Registry::HiveParser::Load(systemPath, &rerr);
        if (!system) {
            if (err) err->Set(ErrorCode::HiveLoad, L"SYSTEM hive: " + rerr.message, systemPath.wstring());
        }
        else {
            auto sam = Registry::HiveParser::Load(samPath, &rerr);
            if (!sam) {
                if (err) err->Set(ErrorCode::HiveLoad, L"SAM hive: " + rerr.message, samPath.wstring());
            }
            else {
                ok = ScanHives(*sam, *system, options, report, err);
            }
        }
    }

    report.finishedAt = std::chrono::system_clock::now();
    return ok;
}

}  // namespace Detection
}  // namespace SamAudit
