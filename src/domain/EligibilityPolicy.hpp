/**
 * @file EligibilityPolicy.hpp
 * @brief Caller-supplied visa issuance rules and the applicant's claimed identity.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace docverify::domain {

/**
 * @struct VisaTypeRequirement
 * @brief Per-visa-type overrides. Unset members fall back to the policy-wide values.
 */
struct VisaTypeRequirement {
    std::optional<int> minAge;
    std::optional<std::set<std::string>> allowedNationalities;
    std::vector<std::string> additionalRequirements;
};

/**
 * @struct EligibilityPolicy
 * @brief Read-only configuration for the eligibility checker.
 *
 * Empty allowedNationalities / requiredDocumentTypes mean "no restriction".
 */
struct EligibilityPolicy {
    int minAge = 0;
    int maxAge = 150;
    std::set<std::string> allowedNationalities;
    std::set<std::string> blockedNationalities;
    std::set<std::string> requiredDocumentTypes;
    int minValidityMonths = 0;
    std::map<std::string, VisaTypeRequirement> visaTypeRequirements;

    /** @brief Requirement entry for a visa type, or nullptr. */
    const VisaTypeRequirement* FindVisaType(const std::string& visaType) const {
        auto it = visaTypeRequirements.find(visaType);
        return it == visaTypeRequirements.end() ? nullptr : &it->second;
    }
};

/**
 * @struct ApplicantData
 * @brief What the applicant claims on the visa form.
 */
struct ApplicantData {
    std::string name;
    std::string dateOfBirth;
    std::string passportNumber;
    std::string nationality;
    std::string intendedVisaType = "tourist";
};

} // namespace docverify::domain
