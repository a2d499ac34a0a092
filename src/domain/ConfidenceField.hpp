/**
 * @file ConfidenceField.hpp
 * @brief Value Object pairing an extracted string with a provenance confidence score.
 */

#pragma once

#include <string>
#include <utility>

namespace docverify::domain {

/**
 * @enum FieldSource
 * @brief Where an extracted value came from.
 */
enum class FieldSource {
    MrzVerified,    ///< Decoded from an MRZ whose check digits all passed.
    MrzUnverified,  ///< Decoded from an MRZ with structural or check digit errors.
    Heuristic,      ///< Found by keyword/pattern search in the free text.
    Placeholder     ///< Heuristic found nothing; value is a stand-in (see ExtractionOptions).
};

inline std::string FieldSourceToString(FieldSource source) {
    switch (source) {
        case FieldSource::MrzVerified: return "mrz-verified";
        case FieldSource::MrzUnverified: return "mrz-unverified";
        case FieldSource::Heuristic: return "heuristic";
        case FieldSource::Placeholder: return "placeholder";
        default: return "unknown";
    }
}

/**
 * @struct ConfidenceField
 * @brief A value plus a 0-100 score.
 *
 * The score only orders sources (checksum-verified > MRZ-present-unverified > heuristic);
 * it is not a calibrated probability.
 */
struct ConfidenceField {
    std::string value;
    int confidence = 0;
    FieldSource source = FieldSource::Heuristic;

    ConfidenceField() = default;
    ConfidenceField(std::string v, int conf, FieldSource src = FieldSource::Heuristic)
        : value(std::move(v)), confidence(conf), source(src) {}

    bool operator==(const ConfidenceField& other) const {
        return value == other.value && confidence == other.confidence && source == other.source;
    }
    bool operator!=(const ConfidenceField& other) const { return !(*this == other); }
};

} // namespace docverify::domain
