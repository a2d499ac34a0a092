/**
 * @file DocumentValidator.hpp
 * @brief Internal consistency checks over one extracted document.
 */

#pragma once

#include <vector>

#include "domain/CalendarDate.hpp"
#include "domain/CheckResult.hpp"
#include "domain/ExtractedDocument.hpp"

namespace docverify::application {

/**
 * @class DocumentValidator
 * @brief Runs a fixed, ordered battery of self-contained document checks.
 *
 * Checks share no state and never throw: unparseable input becomes a failed verdict.
 */
class DocumentValidator {
public:
    using CheckFn = domain::ValidationCheck (*)(const domain::ExtractedDocument&, const domain::CalendarDate&);

    struct NamedCheck {
        const char* name;
        CheckFn run;
    };

    /** @brief The battery, in display order. */
    static const std::vector<NamedCheck>& Checks();

    /**
     * @brief Runs every check against today's date.
     * @return One verdict per check, in Checks() order.
     */
    std::vector<domain::ValidationCheck> Validate(const domain::ExtractedDocument& doc) const;

    /** @brief Runs every check against an explicit reference date. */
    std::vector<domain::ValidationCheck> Validate(const domain::ExtractedDocument& doc,
                                                  const domain::CalendarDate& today) const;

    /** @brief Fails when expiryDate is before today or not a valid date. */
    static domain::ValidationCheck CheckDocumentExpiry(const domain::ExtractedDocument& doc, const domain::CalendarDate& today);
    /** @brief All three dates must be shaped YYYY-MM-DD. */
    static domain::ValidationCheck CheckDateFormats(const domain::ExtractedDocument& doc, const domain::CalendarDate& today);
    /** @brief Age from dateOfBirth must lie in [0, 150]. */
    static domain::ValidationCheck CheckAgeConsistency(const domain::ExtractedDocument& doc, const domain::CalendarDate& today);
    static domain::ValidationCheck CheckNameFormat(const domain::ExtractedDocument& doc, const domain::CalendarDate& today);
    static domain::ValidationCheck CheckDocumentNumberFormat(const domain::ExtractedDocument& doc, const domain::CalendarDate& today);
    static domain::ValidationCheck CheckNationalityFormat(const domain::ExtractedDocument& doc, const domain::CalendarDate& today);
    /** @brief birth < issue < expiry, and birth not after today. */
    static domain::ValidationCheck CheckDateLogic(const domain::ExtractedDocument& doc, const domain::CalendarDate& today);

    /** @brief Oldest plausible holder age. */
    static constexpr int MaxPlausibleAge = 150;
};

} // namespace docverify::application
