/**
 * @file DocumentValidator.cpp
 * @brief Implementation of the document validity battery.
 */

#include "application/DocumentValidator.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace docverify::application {

using domain::CalendarDate;
using domain::ExtractedDocument;
using domain::ValidationCheck;

namespace {

constexpr const char* kExpiry = "Document Expiry";
constexpr const char* kDateFormat = "Date Format Validation";
constexpr const char* kAge = "Age Consistency";
constexpr const char* kName = "Name Format";
constexpr const char* kDocNumber = "Document Number Format";
constexpr const char* kNationality = "Nationality Code Format";
constexpr const char* kDateLogic = "Date Logic";

bool IsIsoShaped(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') return false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
    }
    return true;
}

// [A-Za-z\s\-']+
bool IsNameText(const std::string& value) {
    if (value.empty()) return false;
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalpha(c) || std::isspace(c) || c == '-' || c == '\'';
    });
}

} // namespace

const std::vector<DocumentValidator::NamedCheck>& DocumentValidator::Checks() {
    static const std::vector<NamedCheck> checks = {
        {kExpiry, &DocumentValidator::CheckDocumentExpiry},
        {kDateFormat, &DocumentValidator::CheckDateFormats},
        {kAge, &DocumentValidator::CheckAgeConsistency},
        {kName, &DocumentValidator::CheckNameFormat},
        {kDocNumber, &DocumentValidator::CheckDocumentNumberFormat},
        {kNationality, &DocumentValidator::CheckNationalityFormat},
        {kDateLogic, &DocumentValidator::CheckDateLogic},
    };
    return checks;
}

std::vector<ValidationCheck> DocumentValidator::Validate(const ExtractedDocument& doc) const {
    return Validate(doc, CalendarDate::Today());
}

std::vector<ValidationCheck> DocumentValidator::Validate(const ExtractedDocument& doc, const CalendarDate& today) const {
    std::vector<ValidationCheck> results;
    results.reserve(Checks().size());
    for (const auto& check : Checks()) {
        results.push_back(check.run(doc, today));
    }
    return results;
}

ValidationCheck DocumentValidator::CheckDocumentExpiry(const ExtractedDocument& doc, const CalendarDate& today) {
    const auto expiry = CalendarDate::ParseIso(doc.expiryDate.value);
    if (!expiry) {
        return ValidationCheck::Fail(kExpiry, "Invalid expiry date format");
    }
    if (*expiry < today) {
        return ValidationCheck::Fail(kExpiry, "Document expired on " + doc.expiryDate.value);
    }
    return ValidationCheck::Pass(kExpiry, "Document valid until " + doc.expiryDate.value);
}

ValidationCheck DocumentValidator::CheckDateFormats(const ExtractedDocument& doc, const CalendarDate&) {
    const std::pair<const char*, const std::string*> dates[] = {
        {"Date of Birth", &doc.dateOfBirth.value},
        {"Issue Date", &doc.issueDate.value},
        {"Expiry Date", &doc.expiryDate.value},
    };

    std::string invalid;
    for (const auto& [label, value] : dates) {
        if (IsIsoShaped(*value)) continue;
        if (!invalid.empty()) invalid += ", ";
        invalid += label;
    }

    if (!invalid.empty()) {
        return ValidationCheck::Fail(kDateFormat, "Invalid date formats: " + invalid);
    }
    return ValidationCheck::Pass(kDateFormat, "All dates in valid ISO 8601 format");
}

ValidationCheck DocumentValidator::CheckAgeConsistency(const ExtractedDocument& doc, const CalendarDate& today) {
    const auto dob = CalendarDate::ParseIso(doc.dateOfBirth.value);
    if (!dob) {
        return ValidationCheck::Fail(kAge, "Unable to calculate age from date of birth");
    }
    const int age = CalendarDate::AgeOn(*dob, today);
    if (age < 0 || age > MaxPlausibleAge) {
        return ValidationCheck::Fail(kAge, "Calculated age (" + std::to_string(age) + ") is invalid");
    }
    return ValidationCheck::Pass(kAge, "Holder age: " + std::to_string(age) + " years");
}

ValidationCheck DocumentValidator::CheckNameFormat(const ExtractedDocument& doc, const CalendarDate&) {
    const std::string& surname = doc.surname.value;
    const std::string& given = doc.givenNames.value;
    const bool valid = IsNameText(surname) && (given.empty() || IsNameText(given));
    if (!valid) {
        return ValidationCheck::Fail(kName, "Invalid name format or missing required fields");
    }
    return ValidationCheck::Pass(kName, "Name format valid");
}

ValidationCheck DocumentValidator::CheckDocumentNumberFormat(const ExtractedDocument& doc, const CalendarDate&) {
    const std::string& number = doc.documentNumber.value;
    const bool lengthOk = number.size() >= 6 && number.size() <= 12;
    const bool charsOk = std::all_of(number.begin(), number.end(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    });
    if (!lengthOk || !charsOk) {
        return ValidationCheck::Fail(kDocNumber, "Document number format invalid (should be 6-12 alphanumeric characters)");
    }
    return ValidationCheck::Pass(kDocNumber, "Document number format valid");
}

ValidationCheck DocumentValidator::CheckNationalityFormat(const ExtractedDocument& doc, const CalendarDate&) {
    const std::string& code = doc.nationality.value;
    const bool valid = code.size() == 3 &&
        std::all_of(code.begin(), code.end(), [](unsigned char c) { return c >= 'A' && c <= 'Z'; });
    if (!valid) {
        return ValidationCheck::Fail(kNationality, "Invalid nationality code (should be 3-letter ISO code)");
    }
    return ValidationCheck::Pass(kNationality, "Valid nationality code: " + code);
}

ValidationCheck DocumentValidator::CheckDateLogic(const ExtractedDocument& doc, const CalendarDate& today) {
    const auto dob = CalendarDate::ParseIso(doc.dateOfBirth.value);
    const auto issued = CalendarDate::ParseIso(doc.issueDate.value);
    const auto expiry = CalendarDate::ParseIso(doc.expiryDate.value);
    if (!dob || !issued || !expiry) {
        return ValidationCheck::Fail(kDateLogic, "Unable to validate date logic");
    }

    const bool ordered = *dob < *issued && *issued < *expiry && *dob <= today;
    if (!ordered) {
        return ValidationCheck::Fail(kDateLogic, "Date sequence error: dates are not in logical order");
    }
    return ValidationCheck::Pass(kDateLogic, "All dates are logically consistent");
}

} // namespace docverify::application
