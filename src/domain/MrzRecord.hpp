/**
 * @file MrzRecord.hpp
 * @brief Decoded machine-readable zone, as produced by the MRZ codec.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docverify::domain {

/**
 * @enum MrzLayout
 * @brief ICAO 9303 size classes the codec understands.
 */
enum class MrzLayout {
    TD3,  ///< 2 lines x 44 characters (passport booklet, visa).
    TD1   ///< 3 lines x 30 characters (ID card).
};

inline std::string LayoutToString(MrzLayout layout) {
    switch (layout) {
        case MrzLayout::TD3: return "TD3";
        case MrzLayout::TD1: return "TD1";
        default: return "Unknown";
    }
}

/**
 * @struct MrzRecord
 * @brief Best-effort decode of the candidate lines.
 *
 * A record with valid == false still carries whatever could be sliced; only a failure
 * on the line count leaves every field unset.
 */
struct MrzRecord {
    std::optional<MrzLayout> layout;
    std::vector<std::string> lines;   ///< Candidate lines the record was parsed from.

    std::optional<std::string> documentType;
    std::optional<std::string> issuingCountry;
    std::optional<std::string> documentNumber;
    std::optional<std::string> surname;
    std::optional<std::string> givenNames;
    std::optional<std::string> nationality;
    std::optional<std::string> dateOfBirth;    ///< YYYY-MM-DD, calendar validity not checked.
    std::optional<std::string> sex;
    std::optional<std::string> expiryDate;     ///< YYYY-MM-DD, calendar validity not checked.
    std::optional<std::string> personalNumber; ///< TD3 only.

    bool valid = false;
    std::vector<std::string> errors;

    bool operator==(const MrzRecord& other) const {
        return layout == other.layout && lines == other.lines &&
               documentType == other.documentType && issuingCountry == other.issuingCountry &&
               documentNumber == other.documentNumber && surname == other.surname &&
               givenNames == other.givenNames && nationality == other.nationality &&
               dateOfBirth == other.dateOfBirth && sex == other.sex &&
               expiryDate == other.expiryDate && personalNumber == other.personalNumber &&
               valid == other.valid && errors == other.errors;
    }
};

} // namespace docverify::domain
