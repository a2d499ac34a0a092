/**
 * @file ExtractedDocument.hpp
 * @brief Entity holding the merged field set of one travel document.
 */

#pragma once

#include <optional>
#include <vector>

#include "domain/ConfidenceField.hpp"

namespace docverify::domain {

/**
 * @struct ExtractedDocument
 * @brief All mandatory fields are always present; an empty value means "unknown".
 */
struct ExtractedDocument {
    ConfidenceField documentType;
    ConfidenceField documentNumber;
    ConfidenceField surname;
    ConfidenceField givenNames;
    ConfidenceField nationality;
    ConfidenceField dateOfBirth;
    ConfidenceField sex;
    std::optional<ConfidenceField> placeOfBirth;
    ConfidenceField issuingCountry;
    ConfidenceField issueDate;
    ConfidenceField expiryDate;
    std::optional<ConfidenceField> mrzLine1;
    std::optional<ConfidenceField> mrzLine2;
    std::optional<ConfidenceField> mrzLine3;

    /** @brief "givenNames surname", trimmed. */
    std::string HolderName() const {
        std::string name = givenNames.value + " " + surname.value;
        const auto first = name.find_first_not_of(' ');
        if (first == std::string::npos) return {};
        const auto last = name.find_last_not_of(' ');
        return name.substr(first, last - first + 1);
    }

    /** @brief Every present field, mandatory ones first, in declaration order. */
    std::vector<const ConfidenceField*> PresentFields() const {
        std::vector<const ConfidenceField*> fields = {
            &documentType, &documentNumber, &surname, &givenNames, &nationality,
            &dateOfBirth, &sex
        };
        if (placeOfBirth) fields.push_back(&*placeOfBirth);
        fields.push_back(&issuingCountry);
        fields.push_back(&issueDate);
        fields.push_back(&expiryDate);
        if (mrzLine1) fields.push_back(&*mrzLine1);
        if (mrzLine2) fields.push_back(&*mrzLine2);
        if (mrzLine3) fields.push_back(&*mrzLine3);
        return fields;
    }

    bool operator==(const ExtractedDocument& other) const {
        return documentType == other.documentType && documentNumber == other.documentNumber &&
               surname == other.surname && givenNames == other.givenNames &&
               nationality == other.nationality && dateOfBirth == other.dateOfBirth &&
               sex == other.sex && placeOfBirth == other.placeOfBirth &&
               issuingCountry == other.issuingCountry && issueDate == other.issueDate &&
               expiryDate == other.expiryDate && mrzLine1 == other.mrzLine1 &&
               mrzLine2 == other.mrzLine2 && mrzLine3 == other.mrzLine3;
    }
};

} // namespace docverify::domain
