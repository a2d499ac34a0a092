/**
 * @file EligibilityChecker.hpp
 * @brief Cross-checks a document against the applicant's claims and a visa policy.
 */

#pragma once

#include <vector>

#include "domain/CalendarDate.hpp"
#include "domain/CheckResult.hpp"
#include "domain/EligibilityPolicy.hpp"
#include "domain/ExtractedDocument.hpp"

namespace docverify::application {

/**
 * @class EligibilityChecker
 * @brief Fixed, ordered battery of eligibility checks. Policy and applicant are read-only.
 */
class EligibilityChecker {
public:
    using CheckFn = domain::EligibilityCheck (*)(const domain::ExtractedDocument&,
                                                 const domain::ApplicantData&,
                                                 const domain::EligibilityPolicy&,
                                                 const domain::CalendarDate&);

    struct NamedCheck {
        const char* name;
        CheckFn run;
    };

    static const std::vector<NamedCheck>& Checks();

    std::vector<domain::EligibilityCheck> Check(const domain::ExtractedDocument& doc,
                                                const domain::ApplicantData& applicant,
                                                const domain::EligibilityPolicy& policy) const;

    std::vector<domain::EligibilityCheck> Check(const domain::ExtractedDocument& doc,
                                                const domain::ApplicantData& applicant,
                                                const domain::EligibilityPolicy& policy,
                                                const domain::CalendarDate& today) const;

    /** @brief Case-insensitive, trimmed equality of "givenNames surname" and the claimed name. */
    static domain::EligibilityCheck CheckNameMatch(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                   const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);
    static domain::EligibilityCheck CheckDateOfBirthMatch(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                          const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);
    static domain::EligibilityCheck CheckPassportNumberMatch(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                             const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);
    static domain::EligibilityCheck CheckNationalityMatch(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                          const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);
    /** @brief Visa-type minAge overrides policy.minAge; policy.maxAge always applies. */
    static domain::EligibilityCheck CheckAgeRequirements(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                         const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);
    static domain::EligibilityCheck CheckNationalityEligibility(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                                const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);
    static domain::EligibilityCheck CheckDocumentType(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                      const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);
    /** @brief Remaining validity in 30-day months must reach policy.minValidityMonths. */
    static domain::EligibilityCheck CheckValidityPeriod(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                        const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);
    static domain::EligibilityCheck CheckVisaTypeRequirements(const domain::ExtractedDocument& doc, const domain::ApplicantData& applicant,
                                                              const domain::EligibilityPolicy& policy, const domain::CalendarDate& today);

    static constexpr double DaysPerMonth = 30.0;
};

} // namespace docverify::application
