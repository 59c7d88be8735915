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
 * SamAudit Detection - WEAK LOCAL CREDENTIAL DETECTOR
 * ============================================================================
 *
 * @file WeakCredentialDetector.hpp
 * @brief Recovers local account hashes from a SAM/SYSTEM pair and raises
 *        findings for LM storage and dictionary-weak passwords.
 *
 * FINDINGS:
 * =========
 *
 * PASSWORD_HASH_LM_FORMAT (High)   at least one account has an LM hash
 * WINDOWS_WEAK_PASSWORD (Critical) a hash matched the LM or NT dictionary
 *
 * The LM dictionary is consulted first; an NT lookup only happens when the
 * LM hash is absent or unknown.
 *
 * HIVE COPIES:
 * ============
 *
 * The caller owns the hive files. With deleteHivesAfterScan the detector
 * removes them once the scan ends, whether it succeeded or not.
 * ============================================================================
 */

#pragma once

#include "DetectionTypes.hpp"
#include "HashDictionary.hpp"
#include "../Credentials/UserEnumerator.hpp"
#include "../Registry/RegistryHive.hpp"

#include <filesystem>
#include <vector>

namespace SamAudit {
namespace Detection {

/**
 * @brief Detector behaviour
 */
struct DetectorOptions {
    Credentials::EnumerationOptions enumeration;
    bool deleteHivesAfterScan = false;
};

/**
 * @class WeakCredentialDetector
 * @brief Runs the pipeline and turns recovered hashes into findings
 *
 * The dictionaries must outlive the detector.
 */
class WeakCredentialDetector final {
public:
    WeakCredentialDetector(const HashDictionary& lmDictionary,
                           const HashDictionary& ntDictionary) noexcept;

    /**
     * @brief Scan hive files
     * @param err HiveLoad, ScanFatal or UserFailure (fail-fast) on failure
     */
    [[nodiscard]] bool Scan(const std::filesystem::path& samPath,
                            const std::filesystem::path& systemPath,
                            const DetectorOptions& options, ScanReport& report,
                            Error* err = nullptr) const;

    /**
     * @brief Scan already opened hives
     */
    [[nodiscard]] bool ScanHives(const Registry::Hive& samHive, const Registry::Hive& systemHive,
                                 const DetectorOptions& options, ScanReport& report,
                                 Error* err = nullptr) const;

    /**
     * @brief Raise findings for a set of decoded accounts
     */
    [[nodiscard]] std::vector<Finding> Evaluate(const std::vector<Credentials::UserRecord>& users) const;

    /**
     * @brief Dictionary lookup for one account, LM first
     * @return true when a cleartext was recovered
     */
    [[nodiscard]] bool Crack(const Credentials::UserRecord& user, WeakCredential& out) const;

    [[nodiscard]] static Finding LmFormatFinding();
    [[nodiscard]] static Finding WeakPasswordFinding();

private:
    const HashDictionary& m_lm;
    const HashDictionary& m_nt;
};

}  // namespace Detection
}  // namespace SamAudit
