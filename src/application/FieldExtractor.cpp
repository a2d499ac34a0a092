/**
 * @file FieldExtractor.cpp
 * @brief Implementation of FieldExtractor.
 */

#include "application/FieldExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <regex>
#include <sstream>

namespace docverify::application {

using domain::ConfidenceField;
using domain::FieldSource;
using domain::MrzRecord;

namespace {

const std::vector<std::string> kSurnameLabels = {"surname", "last name", "family name"};
const std::vector<std::string> kGivenNameLabels = {"given name", "first name"};
const std::vector<std::string> kPlaceOfBirthLabels = {"place of birth", "birthplace"};
const std::vector<std::string> kBirthKeywords = {"birth", "born", "dob"};
const std::vector<std::string> kIssueKeywords = {"issue", "issued", "date of issue"};
const std::vector<std::string> kExpiryKeywords = {"expiry", "expires", "valid until", "exp"};

std::string ToLower(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string ToUpper(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

std::string Trim(const std::string& s) {
    const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

bool ContainsAny(const std::string& lowered, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (lowered.find(needle) != std::string::npos) return true;
    }
    return false;
}

std::string PadTwo(const std::string& part) {
    return part.size() == 1 ? "0" + part : part;
}

/**
 * Prefers the MRZ value for @p member when present and non-empty, otherwise runs the
 * heuristic. The score follows the source actually used.
 */
ConfidenceField Resolve(const std::optional<MrzRecord>& mrz,
                        const std::optional<std::string> MrzRecord::*member,
                        const std::function<std::string()>& heuristic,
                        int heuristicConfidence) {
    if (mrz) {
        const auto& decoded = (*mrz).*member;
        if (decoded && !decoded->empty()) {
            return mrz->valid
                ? ConfidenceField(*decoded, FieldExtractor::Confidence::MrzVerified, FieldSource::MrzVerified)
                : ConfidenceField(*decoded, FieldExtractor::Confidence::MrzUnverified, FieldSource::MrzUnverified);
        }
    }
    return ConfidenceField(heuristic(), heuristicConfidence, FieldSource::Heuristic);
}

} // namespace

FieldExtractor::FieldExtractor(ExtractionOptions options)
    : m_options(options) {}

domain::ExtractedDocument FieldExtractor::Extract(const std::string& rawText,
                                                  const std::optional<MrzRecord>& mrz) const {
    return Extract(rawText, mrz, domain::CalendarDate::Today());
}

domain::ExtractedDocument FieldExtractor::Extract(const std::string& rawText,
                                                  const std::optional<MrzRecord>& mrz,
                                                  const domain::CalendarDate& today) const {
    // Date heuristics can end in a placeholder, which is tagged separately.
    auto resolveDate = [&](const std::optional<std::string> MrzRecord::*member,
                           const std::vector<std::string>& keywords) {
        bool found = true;
        ConfidenceField field = Resolve(mrz, member, [&]() {
            auto date = ExtractDate(rawText, keywords);
            found = date.has_value();
            return found ? *date : PlaceholderDate(today);
        }, Confidence::Date);
        if (!found) field.source = FieldSource::Placeholder;
        return field;
    };

    domain::ExtractedDocument doc;
    doc.documentType = Resolve(mrz, &MrzRecord::documentType,
                               [&]() { return ExtractDocumentType(rawText); }, Confidence::DocumentType);
    doc.documentNumber = Resolve(mrz, &MrzRecord::documentNumber,
                                 [&]() { return ExtractDocumentNumber(rawText); }, Confidence::DocumentNumber);
    doc.surname = Resolve(mrz, &MrzRecord::surname,
                          [&]() { return ExtractLabeledValue(rawText, kSurnameLabels); }, Confidence::Name);
    doc.givenNames = Resolve(mrz, &MrzRecord::givenNames,
                             [&]() { return ExtractLabeledValue(rawText, kGivenNameLabels); }, Confidence::Name);
    doc.nationality = Resolve(mrz, &MrzRecord::nationality,
                              [&]() { return ExtractCountryCode(rawText); }, Confidence::CountryCode);
    doc.dateOfBirth = resolveDate(&MrzRecord::dateOfBirth, kBirthKeywords);
    doc.sex = Resolve(mrz, &MrzRecord::sex, [&]() { return ExtractSex(rawText); }, Confidence::Sex);
    doc.issuingCountry = Resolve(mrz, &MrzRecord::issuingCountry,
                                 [&]() { return ExtractCountryCode(rawText); }, Confidence::CountryCode);
    doc.expiryDate = resolveDate(&MrzRecord::expiryDate, kExpiryKeywords);

    // Neither MRZ layout carries an issue date.
    if (auto issued = ExtractDate(rawText, kIssueKeywords)) {
        doc.issueDate = ConfidenceField(*issued, Confidence::IssueDate, FieldSource::Heuristic);
    } else {
        doc.issueDate = ConfidenceField(PlaceholderDate(today), Confidence::IssueDate, FieldSource::Placeholder);
    }

    const std::string place = ExtractLabeledValue(rawText, kPlaceOfBirthLabels);
    if (!place.empty()) {
        doc.placeOfBirth = ConfidenceField(place, Confidence::PlaceOfBirth, FieldSource::Heuristic);
    }

    if (mrz && !mrz->lines.empty()) {
        const int lineConfidence = mrz->valid ? Confidence::MrzVerified : Confidence::MrzUnverified;
        const FieldSource lineSource = mrz->valid ? FieldSource::MrzVerified : FieldSource::MrzUnverified;
        std::optional<ConfidenceField>* echoes[] = {&doc.mrzLine1, &doc.mrzLine2, &doc.mrzLine3};
        for (size_t i = 0; i < mrz->lines.size() && i < 3; ++i) {
            *echoes[i] = ConfidenceField(mrz->lines[i], lineConfidence, lineSource);
        }
    }

    return doc;
}

std::string FieldExtractor::PlaceholderDate(const domain::CalendarDate& today) const {
    return m_options.missingDate == MissingDatePolicy::Today ? today.ToIsoString() : std::string();
}

std::string FieldExtractor::ExtractDocumentType(const std::string& text) {
    const std::string upper = ToUpper(text);
    auto has = [&upper](const char* word) { return upper.find(word) != std::string::npos; };
    if (has("PASSPORT")) return "P";
    if (has("VISA")) return "V";
    if (has("IDENTITY") || has("ID CARD")) return "I";
    if (has("DRIVING") || has("LICENSE") || has("LICENCE")) return "D";
    return "P";
}

std::string FieldExtractor::ExtractDocumentNumber(const std::string& text) {
    static const std::regex pattern("[A-Z]{1,2}[0-9]{7,9}");
    std::smatch match;
    return std::regex_search(text, match, pattern) ? match.str(0) : std::string();
}

std::string FieldExtractor::ExtractCountryCode(const std::string& text) {
    static const std::regex pattern("\\b([A-Z]{3})\\b");
    std::smatch match;
    return std::regex_search(text, match, pattern) ? match.str(1) : std::string();
}

std::string FieldExtractor::ExtractLabeledValue(const std::string& text, const std::vector<std::string>& labels) {
    for (const auto& line : SplitLines(text)) {
        if (!ContainsAny(ToLower(line), labels)) continue;
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        const auto nextColon = line.find(':', colon + 1);
        const std::string value = line.substr(colon + 1, nextColon == std::string::npos ? std::string::npos
                                                                                         : nextColon - colon - 1);
        return ToUpper(Trim(value));
    }
    return {};
}

std::string FieldExtractor::ExtractSex(const std::string& text) {
    static const std::regex male("\\bM\\b");
    static const std::regex female("\\bF\\b");
    const std::string upper = ToUpper(text);

    const bool hasM = std::regex_search(upper, male);
    const bool hasF = std::regex_search(upper, female);
    if (hasM && !hasF) return "M";
    if (hasF && !hasM) return "F";

    const bool hasFemale = upper.find("FEMALE") != std::string::npos;
    if (upper.find("MALE") != std::string::npos && !hasFemale) return "M";
    if (hasFemale) return "F";
    return "M";
}

std::optional<std::string> FieldExtractor::ExtractDate(const std::string& text, const std::vector<std::string>& keywords) {
    // D/M/Y must start at a digit boundary so "2030-01-15" is not read as 30-01-15.
    static const std::regex dmy("(^|[^0-9])([0-9]{1,2})[/.\\-]([0-9]{1,2})[/.\\-]([0-9]{2,4})(?![0-9])");
    static const std::regex iso("([0-9]{4})-([0-9]{2})-([0-9]{2})");

    for (const auto& line : SplitLines(text)) {
        if (!ContainsAny(ToLower(line), keywords)) continue;

        std::smatch match;
        if (std::regex_search(line, match, dmy)) {
            std::string year = match.str(4);
            if (year.size() == 2) {
                year = (std::stoi(year) > 50 ? "19" : "20") + year;
            }
            return year + "-" + PadTwo(match.str(3)) + "-" + PadTwo(match.str(2));
        }
        if (std::regex_search(line, match, iso)) {
            return match.str(0);
        }
    }

    std::smatch match;
    if (std::regex_search(text, match, iso)) {
        return match.str(0);
    }
    return std::nullopt;
}

} // namespace docverify::application
