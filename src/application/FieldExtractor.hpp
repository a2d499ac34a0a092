/**
 * @file FieldExtractor.hpp
 * @brief Merges MRZ-decoded values with heuristic free-text extraction.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/CalendarDate.hpp"
#include "domain/ExtractedDocument.hpp"
#include "domain/MrzRecord.hpp"

namespace docverify::application {

/**
 * @enum MissingDatePolicy
 * @brief What a date heuristic returns when the text holds no date at all.
 */
enum class MissingDatePolicy {
    Today,  ///< Reference date as a placeholder (compatible behavior).
    Empty   ///< Empty string, i.e. explicit "unknown".
};

struct ExtractionOptions {
    MissingDatePolicy missingDate = MissingDatePolicy::Today;
};

/**
 * @class FieldExtractor
 * @brief Builds an ExtractedDocument from raw OCR text and an optional MRZ record.
 *
 * Each field prefers a non-empty MRZ value and otherwise falls back to a dedicated
 * heuristic. Confidence depends only on the provenance of the value used.
 */
class FieldExtractor {
public:
    /** @brief Fixed provenance scores. */
    struct Confidence {
        static constexpr int MrzVerified = 95;
        static constexpr int MrzUnverified = 60;
        static constexpr int DocumentType = 80;
        static constexpr int DocumentNumber = 75;
        static constexpr int Name = 75;
        static constexpr int CountryCode = 80;
        static constexpr int Date = 70;
        static constexpr int Sex = 85;
        static constexpr int IssueDate = 70;
        static constexpr int PlaceOfBirth = 70;
    };

    explicit FieldExtractor(ExtractionOptions options = {});

    /**
     * @brief Extracts all fields, using today's date for the missing-date placeholder.
     * @param rawText OCR output.
     * @param mrz Parsed MRZ record, or std::nullopt when no MRZ line was detected.
     */
    domain::ExtractedDocument Extract(const std::string& rawText,
                                      const std::optional<domain::MrzRecord>& mrz) const;

    /** @brief Same as Extract(), with an explicit reference date. */
    domain::ExtractedDocument Extract(const std::string& rawText,
                                      const std::optional<domain::MrzRecord>& mrz,
                                      const domain::CalendarDate& today) const;

    // Heuristics, exposed for unit tests.
    static std::string ExtractDocumentType(const std::string& text);
    static std::string ExtractDocumentNumber(const std::string& text);
    static std::string ExtractCountryCode(const std::string& text);
    static std::string ExtractLabeledValue(const std::string& text, const std::vector<std::string>& labels);
    static std::string ExtractSex(const std::string& text);

    /**
     * @brief Finds a date on a line containing one of @p keywords, then any ISO date.
     * @return YYYY-MM-DD, or std::nullopt if the text has no usable date.
     */
    static std::optional<std::string> ExtractDate(const std::string& text, const std::vector<std::string>& keywords);

private:
    std::string PlaceholderDate(const domain::CalendarDate& today) const;

    ExtractionOptions m_options;
};

} // namespace docverify::application
