/**
 * @file EligibilityChecker.cpp
 * @brief Implementation of the eligibility battery.
 */

#include "application/EligibilityChecker.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace docverify::application {

using domain::ApplicantData;
using domain::CalendarDate;
using domain::EligibilityCheck;
using domain::EligibilityPolicy;
using domain::ExtractedDocument;

namespace {

constexpr const char* kNameMatch = "Name Match";
constexpr const char* kDobMatch = "Date of Birth Match";
constexpr const char* kPassportMatch = "Passport Number Match";
constexpr const char* kNationalityMatch = "Nationality Match";
constexpr const char* kAgeRequirements = "Age Requirements";
constexpr const char* kNationalityEligibility = "Nationality Eligibility";
constexpr const char* kDocumentType = "Document Type";
constexpr const char* kValidityPeriod = "Validity Period";
constexpr const char* kVisaType = "Visa Type Requirements";

std::string NormalizeName(const std::string& input) {
    const auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string out;
    if (first >= last) return out;
    out.reserve(static_cast<size_t>(last - first));
    for (auto it = first; it != last; ++it) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
    }
    return out;
}

std::string Join(const std::set<std::string>& values) {
    std::string out;
    for (const auto& value : values) {
        if (!out.empty()) out += ", ";
        out += value;
    }
    return out;
}

} // namespace

const std::vector<EligibilityChecker::NamedCheck>& EligibilityChecker::Checks() {
    static const std::vector<NamedCheck> checks = {
        {kNameMatch, &EligibilityChecker::CheckNameMatch},
        {kDobMatch, &EligibilityChecker::CheckDateOfBirthMatch},
        {kPassportMatch, &EligibilityChecker::CheckPassportNumberMatch},
        {kNationalityMatch, &EligibilityChecker::CheckNationalityMatch},
        {kAgeRequirements, &EligibilityChecker::CheckAgeRequirements},
        {kNationalityEligibility, &EligibilityChecker::CheckNationalityEligibility},
        {kDocumentType, &EligibilityChecker::CheckDocumentType},
        {kValidityPeriod, &EligibilityChecker::CheckValidityPeriod},
        {kVisaType, &EligibilityChecker::CheckVisaTypeRequirements},
    };
    return checks;
}

std::vector<EligibilityCheck> EligibilityChecker::Check(const ExtractedDocument& doc,
                                                        const ApplicantData& applicant,
                                                        const EligibilityPolicy& policy) const {
    return Check(doc, applicant, policy, CalendarDate::Today());
}

std::vector<EligibilityCheck> EligibilityChecker::Check(const ExtractedDocument& doc,
                                                        const ApplicantData& applicant,
                                                        const EligibilityPolicy& policy,
                                                        const CalendarDate& today) const {
    std::vector<EligibilityCheck> results;
    results.reserve(Checks().size());
    for (const auto& check : Checks()) {
        results.push_back(check.run(doc, applicant, policy, today));
    }
    return results;
}

EligibilityCheck EligibilityChecker::CheckNameMatch(const ExtractedDocument& doc, const ApplicantData& applicant,
                                                    const EligibilityPolicy&, const CalendarDate&) {
    const std::string documentName = NormalizeName(doc.givenNames.value + " " + doc.surname.value);
    const std::string claimedName = NormalizeName(applicant.name);
    if (documentName != claimedName) {
        return EligibilityCheck::Fail(kNameMatch, "Name mismatch: Document shows \"" + documentName +
                                                  "\", applicant claims \"" + claimedName + "\"");
    }
    return EligibilityCheck::Pass(kNameMatch, "Applicant name matches document");
}

EligibilityCheck EligibilityChecker::CheckDateOfBirthMatch(const ExtractedDocument& doc, const ApplicantData& applicant,
                                                           const EligibilityPolicy&, const CalendarDate&) {
    if (doc.dateOfBirth.value != applicant.dateOfBirth) {
        return EligibilityCheck::Fail(kDobMatch, "DOB mismatch: Document shows " + doc.dateOfBirth.value +
                                                 ", applicant claims " + applicant.dateOfBirth);
    }
    return EligibilityCheck::Pass(kDobMatch, "Date of birth matches");
}

EligibilityCheck EligibilityChecker::CheckPassportNumberMatch(const ExtractedDocument& doc, const ApplicantData& applicant,
                                                              const EligibilityPolicy&, const CalendarDate&) {
    if (doc.documentNumber.value != applicant.passportNumber) {
        return EligibilityCheck::Fail(kPassportMatch, "Passport number mismatch: Document shows " + doc.documentNumber.value +
                                                      ", applicant claims " + applicant.passportNumber);
    }
    return EligibilityCheck::Pass(kPassportMatch, "Passport number matches");
}

EligibilityCheck EligibilityChecker::CheckNationalityMatch(const ExtractedDocument& doc, const ApplicantData& applicant,
                                                           const EligibilityPolicy&, const CalendarDate&) {
    if (doc.nationality.value != applicant.nationality) {
        return EligibilityCheck::Fail(kNationalityMatch, "Nationality mismatch: Document shows " + doc.nationality.value +
                                                         ", applicant claims " + applicant.nationality);
    }
    return EligibilityCheck::Pass(kNationalityMatch, "Nationality matches");
}

EligibilityCheck EligibilityChecker::CheckAgeRequirements(const ExtractedDocument& doc, const ApplicantData& applicant,
                                                          const EligibilityPolicy& policy, const CalendarDate& today) {
    const auto dob = CalendarDate::ParseIso(doc.dateOfBirth.value);
    if (!dob) {
        return EligibilityCheck::Fail(kAgeRequirements, "Unable to verify age requirements");
    }

    const int age = CalendarDate::AgeOn(*dob, today);
    int minAge = policy.minAge;
    if (const auto* visa = policy.FindVisaType(applicant.intendedVisaType); visa && visa->minAge) {
        minAge = *visa->minAge;
    }
    const int maxAge = policy.maxAge;

    const std::string range = "(" + std::to_string(minAge) + "-" + std::to_string(maxAge) + ")";
    if (age < minAge || age > maxAge) {
        return EligibilityCheck::Fail(kAgeRequirements, "Age " + std::to_string(age) + " does not meet requirements " + range);
    }
    return EligibilityCheck::Pass(kAgeRequirements, "Age " + std::to_string(age) + " meets requirements " + range);
}

EligibilityCheck EligibilityChecker::CheckNationalityEligibility(const ExtractedDocument& doc, const ApplicantData&,
                                                                 const EligibilityPolicy& policy, const CalendarDate&) {
    const std::string& nationality = doc.nationality.value;
    if (policy.blockedNationalities.count(nationality) > 0) {
        return EligibilityCheck::Fail(kNationalityEligibility, "Nationality " + nationality + " is not eligible for visa");
    }
    if (!policy.allowedNationalities.empty() && policy.allowedNationalities.count(nationality) == 0) {
        return EligibilityCheck::Fail(kNationalityEligibility, "Nationality " + nationality + " is not in allowed list");
    }
    return EligibilityCheck::Pass(kNationalityEligibility, "Nationality " + nationality + " is eligible");
}

EligibilityCheck EligibilityChecker::CheckDocumentType(const ExtractedDocument& doc, const ApplicantData&,
                                                       const EligibilityPolicy& policy, const CalendarDate&) {
    const std::string& type = doc.documentType.value;
    if (!policy.requiredDocumentTypes.empty() && policy.requiredDocumentTypes.count(type) == 0) {
        return EligibilityCheck::Fail(kDocumentType, "Document type " + type + " is not accepted. Required: " +
                                                     Join(policy.requiredDocumentTypes));
    }
    return EligibilityCheck::Pass(kDocumentType, "Document type " + type + " is accepted");
}

EligibilityCheck EligibilityChecker::CheckValidityPeriod(const ExtractedDocument& doc, const ApplicantData&,
                                                         const EligibilityPolicy& policy, const CalendarDate& today) {
    const auto expiry = CalendarDate::ParseIso(doc.expiryDate.value);
    if (!expiry) {
        return EligibilityCheck::Fail(kValidityPeriod, "Unable to verify validity period");
    }

    const double monthsValid = static_cast<double>(today.DaysUntil(*expiry)) / DaysPerMonth;
    const std::string months = std::to_string(static_cast<long long>(std::floor(monthsValid)));
    const std::string required = std::to_string(policy.minValidityMonths);
    if (monthsValid < policy.minValidityMonths) {
        return EligibilityCheck::Fail(kValidityPeriod, "Document only valid for " + months + " months, requires " + required);
    }
    return EligibilityCheck::Pass(kValidityPeriod, "Document valid for " + months + " months (min: " + required + ")");
}

EligibilityCheck EligibilityChecker::CheckVisaTypeRequirements(const ExtractedDocument& doc, const ApplicantData& applicant,
                                                               const EligibilityPolicy& policy, const CalendarDate&) {
    const std::string& visaType = applicant.intendedVisaType;
    const auto* requirement = policy.FindVisaType(visaType);
    if (!requirement) {
        return EligibilityCheck::Pass(kVisaType, "No specific requirements for visa type: " + visaType);
    }

    const std::string& nationality = doc.nationality.value;
    const auto& allowed = requirement->allowedNationalities;
    if (allowed && !allowed->empty() && allowed->count(nationality) == 0) {
        return EligibilityCheck::Fail(kVisaType, "Nationality " + nationality + " not eligible for " + visaType + " visa");
    }
    return EligibilityCheck::Pass(kVisaType, "Meets all requirements for " + visaType + " visa");
}

} // namespace docverify::application
