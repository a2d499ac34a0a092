/**
 * @file MrzCodec.cpp
 * @brief Implementation of MrzCodec.
 */

#include "domain/mrz/MrzCodec.hpp"
#include "domain/mrz/MrzFormat.hpp"

#include <algorithm>
#include <cctype>

namespace docverify::domain::mrz {

namespace {

std::string Slice(const std::string& line, const FieldSpan& span) {
    if (span.offset >= line.size()) return {};
    return line.substr(span.offset, span.length);
}

char CharAt(const std::string& line, std::size_t index) {
    return index < line.size() ? line[index] : '\0';
}

std::string StripFiller(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c != MrzFormat::Filler) out.push_back(c);
    }
    return out;
}

void Trim(std::string& s) {
    const auto first = s.find_first_not_of(' ');
    if (first == std::string::npos) {
        s.clear();
        return;
    }
    s.erase(0, first);
    s.erase(s.find_last_not_of(' ') + 1);
}

std::string FillerToSpaces(std::string raw) {
    std::replace(raw.begin(), raw.end(), MrzFormat::Filler, ' ');
    Trim(raw);
    return raw;
}

void SplitName(const std::string& field, MrzRecord& record) {
    const std::string separator(2, MrzFormat::Filler);
    const auto split = field.find(separator);
    if (split == std::string::npos) {
        record.surname = FillerToSpaces(field);
        record.givenNames = std::string();
        return;
    }
    record.surname = FillerToSpaces(field.substr(0, split));
    const std::string rest = field.substr(split + separator.size());
    record.givenNames = FillerToSpaces(rest.substr(0, rest.find(separator)));
}

void VerifyCheckDigit(MrzRecord& record, const std::string& label, const std::string& data, char checkChar) {
    if (checkChar == MrzFormat::Filler) return;
    const int expected = MrzCodec::ComputeCheckDigit(data);
    const bool matches = std::isdigit(static_cast<unsigned char>(checkChar)) && (checkChar - '0') == expected;
    if (!matches) {
        const std::string got = checkChar == '\0' ? std::string("nothing") : std::string(1, checkChar);
        record.errors.push_back(label + " check digit failed: expected " + std::to_string(expected) + ", got " + got);
    }
}

void VerifyLineLengths(const std::vector<std::string>& lines, std::size_t expected, MrzRecord& record) {
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].size() != expected) {
            record.errors.push_back("Line " + std::to_string(i + 1) + " length invalid: " +
                                    std::to_string(lines[i].size()) + ", expected " + std::to_string(expected));
        }
    }
}

std::string SexFrom(char c) {
    if (c == '\0' || c == MrzFormat::Filler) return {};
    return std::string(1, c);
}

} // namespace

MrzCandidateLines MrzCodec::DetectLines(std::string_view text) {
    return MrzCandidateLines(text);
}

MrzRecord MrzCodec::Parse(const std::vector<std::string>& lines) {
    MrzRecord record;
    record.lines = lines;

    if (lines.size() == MrzFormat::Td3::LineCount) {
        record.layout = MrzLayout::TD3;
        DecodeTd3(lines, record);
    } else if (lines.size() == MrzFormat::Td1::LineCount) {
        record.layout = MrzLayout::TD1;
        DecodeTd1(lines, record);
    } else {
        record.errors.push_back(InvalidLineCountError);
        record.valid = false;
        return record;
    }

    record.valid = record.errors.empty();
    return record;
}

MrzRecord MrzCodec::ParseAndValidate(const std::string& rawText) {
    return Parse(DetectLines(rawText).ToVector());
}

int MrzCodec::CharacterValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return 0;
}

int MrzCodec::ComputeCheckDigit(std::string_view data) {
    int sum = 0;
    for (std::size_t i = 0; i < data.size(); ++i) {
        sum += CharacterValue(data[i]) * MrzFormat::CheckDigitWeights[i % MrzFormat::CheckDigitWeights.size()];
    }
    return sum % 10;
}

std::string MrzCodec::ExpandDate(std::string_view yymmdd) {
    if (yymmdd.size() != 6) return {};
    if (!std::isdigit(static_cast<unsigned char>(yymmdd[0])) ||
        !std::isdigit(static_cast<unsigned char>(yymmdd[1]))) {
        return {};
    }
    const int yy = (yymmdd[0] - '0') * 10 + (yymmdd[1] - '0');
    const int year = yy > MrzFormat::CenturyPivot ? 1900 + yy : 2000 + yy;
    return std::to_string(year) + "-" + std::string(yymmdd.substr(2, 2)) + "-" + std::string(yymmdd.substr(4, 2));
}

void MrzCodec::DecodeTd3(const std::vector<std::string>& lines, MrzRecord& record) {
    using F = MrzFormat::Td3;
    const std::string& line1 = lines[0];
    const std::string& line2 = lines[1];

    VerifyLineLengths(lines, F::LineLength, record);

    record.documentType = StripFiller(Slice(line1, F::DocumentType));
    record.issuingCountry = StripFiller(Slice(line1, F::IssuingCountry));
    SplitName(Slice(line1, F::Name), record);

    const std::string docNumber = Slice(line2, F::DocumentNumber);
    record.documentNumber = StripFiller(docNumber);
    VerifyCheckDigit(record, "Document number", docNumber, CharAt(line2, F::DocumentNumberCheck));

    record.nationality = StripFiller(Slice(line2, F::Nationality));

    const std::string dob = Slice(line2, F::DateOfBirth);
    record.dateOfBirth = ExpandDate(dob);
    VerifyCheckDigit(record, "Date of birth", dob, CharAt(line2, F::DateOfBirthCheck));

    record.sex = SexFrom(CharAt(line2, F::Sex));

    const std::string expiry = Slice(line2, F::ExpiryDate);
    record.expiryDate = ExpandDate(expiry);
    VerifyCheckDigit(record, "Expiry date", expiry, CharAt(line2, F::ExpiryDateCheck));

    const std::string personal = Slice(line2, F::PersonalNumber);
    record.personalNumber = StripFiller(personal);
    if (!record.personalNumber->empty()) {
        VerifyCheckDigit(record, "Personal number", personal, CharAt(line2, F::PersonalNumberCheck));
    }

    std::string composite;
    for (const auto& part : F::CompositeParts) {
        composite += Slice(line2, part);
    }
    VerifyCheckDigit(record, "Composite", composite, CharAt(line2, F::CompositeCheck));
}

void MrzCodec::DecodeTd1(const std::vector<std::string>& lines, MrzRecord& record) {
    using F = MrzFormat::Td1;
    const std::string& line1 = lines[0];
    const std::string& line2 = lines[1];
    const std::string& line3 = lines[2];

    VerifyLineLengths(lines, F::LineLength, record);

    record.documentType = StripFiller(Slice(line1, F::DocumentType));
    record.issuingCountry = StripFiller(Slice(line1, F::IssuingCountry));

    const std::string docNumber = Slice(line1, F::DocumentNumber);
    record.documentNumber = StripFiller(docNumber);
    VerifyCheckDigit(record, "Document number", docNumber, CharAt(line1, F::DocumentNumberCheck));

    const std::string dob = Slice(line2, F::DateOfBirth);
    record.dateOfBirth = ExpandDate(dob);
    VerifyCheckDigit(record, "Date of birth", dob, CharAt(line2, F::DateOfBirthCheck));

    record.sex = SexFrom(CharAt(line2, F::Sex));

    const std::string expiry = Slice(line2, F::ExpiryDate);
    record.expiryDate = ExpandDate(expiry);
    VerifyCheckDigit(record, "Expiry date", expiry, CharAt(line2, F::ExpiryDateCheck));

    record.nationality = StripFiller(Slice(line2, F::Nationality));

    SplitName(Slice(line3, F::Name), record);
}

} // namespace docverify::domain::mrz
