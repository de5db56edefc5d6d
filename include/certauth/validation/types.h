/**
 * @file types.h
 * @brief Common types for the certauth validation layer
 *
 * Shared enums and result structs used by the classifier, the chain policy
 * and the chain validator.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace certauth {
namespace validation {

/// @brief Certificate category used by the policy gate
enum class CertificateType {
    SELF_SIGNED,  ///< Subject == issuer and signature verifies with its own key
    CHAINED       ///< Everything else (issued by some other authority)
};

/**
 * @brief Set over {SELF_SIGNED, CHAINED}
 *
 * A certificate must match at least one member or it is rejected before
 * any chain work is done.
 */
class AllowedCertificateTypes {
public:
    AllowedCertificateTypes() = default;

    static AllowedCertificateTypes chained() { return AllowedCertificateTypes(CHAINED_BIT); }
    static AllowedCertificateTypes selfSigned() { return AllowedCertificateTypes(SELF_SIGNED_BIT); }
    static AllowedCertificateTypes all() { return AllowedCertificateTypes(CHAINED_BIT | SELF_SIGNED_BIT); }

    bool contains(CertificateType type) const { return (bits_ & bitFor(type)) != 0; }
    bool empty() const { return bits_ == 0; }

    AllowedCertificateTypes& add(CertificateType type) {
        bits_ |= bitFor(type);
        return *this;
    }

    AllowedCertificateTypes& remove(CertificateType type) {
        bits_ &= static_cast<uint8_t>(~bitFor(type));
        return *this;
    }

    bool operator==(const AllowedCertificateTypes& other) const { return bits_ == other.bits_; }
    bool operator!=(const AllowedCertificateTypes& other) const { return bits_ != other.bits_; }

private:
    static constexpr uint8_t CHAINED_BIT = 0x01;
    static constexpr uint8_t SELF_SIGNED_BIT = 0x02;

    explicit AllowedCertificateTypes(uint8_t bits) : bits_(bits) {}

    static uint8_t bitFor(CertificateType type) {
        return type == CertificateType::CHAINED ? CHAINED_BIT : SELF_SIGNED_BIT;
    }

    uint8_t bits_ = 0;
};

/// @brief Which certificates in the path are checked for revocation
enum class RevocationFlag {
    END_CERTIFICATE_ONLY,  ///< Leaf only
    ENTIRE_CHAIN,          ///< Every certificate including the root
    EXCLUDE_ROOT           ///< Every certificate except the root
};

/// @brief How revocation data may be obtained (RFC 5280 Section 6.3)
enum class RevocationMode {
    NO_CHECK,            ///< No revocation checking
    ONLINE_BEST_EFFORT,  ///< Network allowed; missing revocation data tolerated
    ONLINE_REQUIRED,     ///< Network allowed; missing revocation data fails the chain
    OFFLINE              ///< Locally cached revocation data only
};

/// @brief Relaxations of path validation, applied by the verify callback
enum class VerificationFlag {
    ALLOW_UNKNOWN_CERTIFICATE_AUTHORITY,  ///< Untrusted/self-signed root tolerated
    IGNORE_END_REVOCATION_UNKNOWN,        ///< Leaf revocation status may be unknown
    IGNORE_NOT_TIME_VALID                 ///< Validity window not enforced
};

/// @brief Per-step chain status (mapped from X509_V_ERR_* codes)
enum class ChainStatusFlag {
    NOT_TIME_VALID,
    REVOKED,
    NOT_SIGNATURE_VALID,
    NOT_VALID_FOR_USAGE,
    UNTRUSTED_ROOT,
    REVOCATION_STATUS_UNKNOWN,
    PARTIAL_CHAIN,
    INVALID_BASIC_CONSTRAINTS,
    INVALID_EXTENSION,
    OFFLINE_REVOCATION,
    CANCELLED,
    OTHER
};

/// @brief One status reported while building the path
struct ChainStatusEntry {
    ChainStatusFlag status = ChainStatusFlag::OTHER;
    std::string detail;  ///< "depth N (subject): OpenSSL error text"

    bool operator==(const ChainStatusEntry& other) const {
        return status == other.status && detail == other.detail;
    }
};

/// @brief Chain build + validation result
struct ChainValidationResult {
    bool valid = false;                     ///< True if the path built without remaining errors
    std::vector<ChainStatusEntry> statuses; ///< Every recorded status, in report order
    int depth = 0;                          ///< Number of certificates in the built path
    std::string path;                       ///< Human-readable path (e.g., "Leaf -> Intermediate -> Root")

    bool hasStatus(ChainStatusFlag flag) const {
        for (const auto& entry : statuses) {
            if (entry.status == flag) return true;
        }
        return false;
    }
};

/// @brief Convert CertificateType to string ("SelfSigned", "Chained")
inline std::string certificateTypeToString(CertificateType t) {
    switch (t) {
        case CertificateType::SELF_SIGNED: return "SelfSigned";
        case CertificateType::CHAINED:     return "Chained";
    }
    return "Unknown";
}

/// @brief Convert RevocationFlag to string
inline std::string revocationFlagToString(RevocationFlag f) {
    switch (f) {
        case RevocationFlag::END_CERTIFICATE_ONLY: return "EndCertificateOnly";
        case RevocationFlag::ENTIRE_CHAIN:         return "EntireChain";
        case RevocationFlag::EXCLUDE_ROOT:         return "ExcludeRoot";
    }
    return "Unknown";
}

/// @brief Convert RevocationMode to string
inline std::string revocationModeToString(RevocationMode m) {
    switch (m) {
        case RevocationMode::NO_CHECK:           return "NoCheck";
        case RevocationMode::ONLINE_BEST_EFFORT: return "OnlineBestEffort";
        case RevocationMode::ONLINE_REQUIRED:    return "Online";
        case RevocationMode::OFFLINE:            return "Offline";
    }
    return "Unknown";
}

/// @brief Convert VerificationFlag to string
inline std::string verificationFlagToString(VerificationFlag f) {
    switch (f) {
        case VerificationFlag::ALLOW_UNKNOWN_CERTIFICATE_AUTHORITY: return "AllowUnknownCertificateAuthority";
        case VerificationFlag::IGNORE_END_REVOCATION_UNKNOWN:       return "IgnoreEndRevocationUnknown";
        case VerificationFlag::IGNORE_NOT_TIME_VALID:               return "IgnoreNotTimeValid";
    }
    return "Unknown";
}

/// @brief Convert ChainStatusFlag to string
inline std::string chainStatusFlagToString(ChainStatusFlag s) {
    switch (s) {
        case ChainStatusFlag::NOT_TIME_VALID:            return "NotTimeValid";
        case ChainStatusFlag::REVOKED:                   return "Revoked";
        case ChainStatusFlag::NOT_SIGNATURE_VALID:       return "NotSignatureValid";
        case ChainStatusFlag::NOT_VALID_FOR_USAGE:       return "NotValidForUsage";
        case ChainStatusFlag::UNTRUSTED_ROOT:            return "UntrustedRoot";
        case ChainStatusFlag::REVOCATION_STATUS_UNKNOWN: return "RevocationStatusUnknown";
        case ChainStatusFlag::PARTIAL_CHAIN:             return "PartialChain";
        case ChainStatusFlag::INVALID_BASIC_CONSTRAINTS: return "InvalidBasicConstraints";
        case ChainStatusFlag::INVALID_EXTENSION:         return "InvalidExtension";
        case ChainStatusFlag::OFFLINE_REVOCATION:        return "OfflineRevocation";
        case ChainStatusFlag::CANCELLED:                 return "Cancelled";
        case ChainStatusFlag::OTHER:                     return "Other";
    }
    return "Unknown";
}

} // namespace validation
} // namespace certauth
