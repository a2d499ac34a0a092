#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/FieldExtractor.hpp"
#include "domain/mrz/MrzCodec.hpp"

using namespace docverify::domain;
using namespace docverify::application;
using docverify::domain::mrz::MrzCodec;

namespace {

const std::string kTd3Line1 = "P<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<<<<<<<<<";
const std::string kTd3Line2 = "L898902C36UTO7408122F1204159ZE184226B<<<<<10";

const std::string kFreeText =
    "REPUBLIC OF UTOPIA\n"
    "PASSPORT\n"
    "Surname: Smith\n"
    "Given Names: John Paul\n"
    "Nationality: GBR\n"
    "Passport No: AB1234567\n"
    "Date of Birth: 15/05/1990\n"
    "Sex: M\n"
    "Place of Birth: London\n"
    "Date of Issue: 2020-01-10\n"
    "Date of Expiry: 2030-01-09\n";

CalendarDate Day(const char* iso) {
    return *CalendarDate::ParseIso(iso);
}

void TestMrzPreferred() {
    std::cout << "[Test] Verified MRZ values win..." << std::endl;
    const std::string text = "PASSPORT\nDate of issue: 15/04/2002\n" + kTd3Line1 + "\n" + kTd3Line2 + "\n";
    const auto mrz = MrzCodec::ParseAndValidate(text);
    assert(mrz.valid);

    FieldExtractor extractor;
    const auto doc = extractor.Extract(text, mrz, Day("2010-01-01"));

    assert(doc.documentType == ConfidenceField("P", 95, FieldSource::MrzVerified));
    assert(doc.documentNumber == ConfidenceField("L898902C3", 95, FieldSource::MrzVerified));
    assert(doc.surname.value == "ERIKSSON");
    assert(doc.givenNames.value == "ANNA MARIA");
    assert(doc.nationality.value == "UTO");
    assert(doc.issuingCountry.value == "UTO");
    assert(doc.dateOfBirth == ConfidenceField("1974-08-12", 95, FieldSource::MrzVerified));
    assert(doc.sex.value == "F");
    assert(doc.expiryDate == ConfidenceField("2012-04-15", 95, FieldSource::MrzVerified));
    assert(doc.issueDate == ConfidenceField("2002-04-15", 70, FieldSource::Heuristic));
    assert(!doc.placeOfBirth.has_value());

    assert(doc.mrzLine1 == ConfidenceField(kTd3Line1, 95, FieldSource::MrzVerified));
    assert(doc.mrzLine2 == ConfidenceField(kTd3Line2, 95, FieldSource::MrzVerified));
    assert(!doc.mrzLine3.has_value());
    assert(doc.HolderName() == "ANNA MARIA ERIKSSON");
}

void TestInvalidMrzScoresLower() {
    std::cout << "[Test] Unverified MRZ values score 60..." << std::endl;
    const std::string altered = "L898902C<3UTO6908061F9406236ZE184226B<<<<<10";
    const std::string text = kTd3Line1 + "\n" + altered + "\n";
    const auto mrz = MrzCodec::ParseAndValidate(text);
    assert(!mrz.valid);

    FieldExtractor extractor;
    const auto doc = extractor.Extract(text, mrz, Day("2010-01-01"));
    assert(doc.documentNumber == ConfidenceField("L898902C", 60, FieldSource::MrzUnverified));
    assert(doc.dateOfBirth == ConfidenceField("1969-08-06", 60, FieldSource::MrzUnverified));
    assert(doc.surname.confidence == 60);
    assert(doc.mrzLine2 == ConfidenceField(altered, 60, FieldSource::MrzUnverified));
}

void TestEmptyMrzFieldFallsBack() {
    std::cout << "[Test] Empty MRZ field falls back to the heuristic..." << std::endl;
    MrzRecord mrz;
    mrz.valid = true;
    mrz.documentType = std::string("P");
    mrz.documentNumber = std::string("");
    mrz.surname = std::string("SMITH");

    FieldExtractor extractor;
    const auto doc = extractor.Extract(kFreeText, mrz, Day("2024-06-01"));
    assert(doc.documentType == ConfidenceField("P", 95, FieldSource::MrzVerified));
    assert(doc.surname == ConfidenceField("SMITH", 95, FieldSource::MrzVerified));
    assert(doc.documentNumber == ConfidenceField("AB1234567", 75, FieldSource::Heuristic));
    assert(doc.givenNames == ConfidenceField("JOHN PAUL", 75, FieldSource::Heuristic));
    // No lines were recorded, so nothing is echoed.
    assert(!doc.mrzLine1.has_value());
}

void TestHeuristicOnly() {
    std::cout << "[Test] Heuristic-only extraction..." << std::endl;
    FieldExtractor extractor;
    const auto doc = extractor.Extract(kFreeText, std::nullopt, Day("2024-06-01"));

    assert(doc.documentType == ConfidenceField("P", 80));
    assert(doc.documentNumber == ConfidenceField("AB1234567", 75));
    assert(doc.surname == ConfidenceField("SMITH", 75));
    assert(doc.givenNames == ConfidenceField("JOHN PAUL", 75));
    assert(doc.nationality == ConfidenceField("GBR", 80));
    assert(doc.issuingCountry == ConfidenceField("GBR", 80));
    assert(doc.dateOfBirth == ConfidenceField("1990-05-15", 70));
    assert(doc.sex == ConfidenceField("M", 85));
    assert(doc.issueDate == ConfidenceField("2020-01-10", 70));
    assert(doc.expiryDate == ConfidenceField("2030-01-09", 70));
    assert(doc.placeOfBirth == ConfidenceField("LONDON", 70));
    assert(!doc.mrzLine1 && !doc.mrzLine2 && !doc.mrzLine3);
}

void TestMissingDates() {
    std::cout << "[Test] Missing dates..." << std::endl;
    const std::string text = "PASSPORT\nSurname: Doe\n";

    FieldExtractor compatible;
    const auto doc = compatible.Extract(text, std::nullopt, Day("2024-06-01"));
    assert(doc.dateOfBirth == ConfidenceField("2024-06-01", 70, FieldSource::Placeholder));
    assert(doc.issueDate == ConfidenceField("2024-06-01", 70, FieldSource::Placeholder));
    assert(doc.expiryDate == ConfidenceField("2024-06-01", 70, FieldSource::Placeholder));
    assert(doc.documentNumber.value.empty());
    assert(doc.nationality.value.empty());

    ExtractionOptions options;
    options.missingDate = MissingDatePolicy::Empty;
    FieldExtractor explicitUnknown(options);
    const auto unknown = explicitUnknown.Extract(text, std::nullopt, Day("2024-06-01"));
    assert(unknown.dateOfBirth == ConfidenceField("", 70, FieldSource::Placeholder));
    assert(unknown.expiryDate.value.empty());
}

void TestHeuristicHelpers() {
    std::cout << "[Test] Heuristic helpers..." << std::endl;
    assert(FieldExtractor::ExtractDocumentType("National Identity Card") == "I");
    assert(FieldExtractor::ExtractDocumentType("ID CARD") == "I");
    assert(FieldExtractor::ExtractDocumentType("Schengen Visa") == "V");
    assert(FieldExtractor::ExtractDocumentType("DRIVING LICENCE") == "D");
    assert(FieldExtractor::ExtractDocumentType("passport") == "P");
    assert(FieldExtractor::ExtractDocumentType("nothing here") == "P");

    assert(FieldExtractor::ExtractDocumentNumber("No. X12345678 issued") == "X12345678");
    assert(FieldExtractor::ExtractDocumentNumber("ab1234567").empty());

    assert(FieldExtractor::ExtractCountryCode("Country: FRA / France") == "FRA");
    assert(FieldExtractor::ExtractCountryCode("Passport of France").empty());

    assert(FieldExtractor::ExtractLabeledValue("Last name:  o'brien \n", {"last name"}) == "O'BRIEN");
    assert(FieldExtractor::ExtractLabeledValue("Family name: DOE: extra", {"family name"}) == "DOE");
    assert(FieldExtractor::ExtractLabeledValue("Surname DOE", {"surname"}).empty());

    assert(FieldExtractor::ExtractSex("Sex: F") == "F");
    assert(FieldExtractor::ExtractSex("Gender: female") == "F");
    assert(FieldExtractor::ExtractSex("Gender: male") == "M");
    assert(FieldExtractor::ExtractSex("M / F") == "M");
    assert(FieldExtractor::ExtractSex("unknown") == "M");
}

void TestDateHeuristic() {
    std::cout << "[Test] Date heuristic..." << std::endl;
    const std::vector<std::string> born = {"born", "dob"};
    assert(FieldExtractor::ExtractDate("Born 5.3.85", born) == std::string("1985-03-05"));
    assert(FieldExtractor::ExtractDate("DOB: 01/02/49", born) == std::string("2049-02-01"));
    assert(FieldExtractor::ExtractDate("DOB: 01-02-1951", born) == std::string("1951-02-01"));
    assert(FieldExtractor::ExtractDate("DOB: 1951-02-01", born) == std::string("1951-02-01"));
    // Falls back to the first ISO date anywhere.
    assert(FieldExtractor::ExtractDate("Issued\nRecorded 2011-11-11", born) == std::string("2011-11-11"));
    assert(!FieldExtractor::ExtractDate("no dates at all", born).has_value());
}

void TestIdempotence() {
    std::cout << "[Test] Extraction idempotence..." << std::endl;
    const std::string text = kFreeText + kTd3Line1 + "\n" + kTd3Line2 + "\n";
    const auto mrz = MrzCodec::ParseAndValidate(text);
    FieldExtractor extractor;
    assert(extractor.Extract(text, mrz, Day("2024-06-01")) == extractor.Extract(text, mrz, Day("2024-06-01")));
}

} // namespace

int main() {
    std::cout << "[Test] Starting Field Extractor Test..." << std::endl;

    TestMrzPreferred();
    TestInvalidMrzScoresLower();
    TestEmptyMrzFieldFallsBack();
    TestHeuristicOnly();
    TestMissingDates();
    TestHeuristicHelpers();
    TestDateHeuristic();
    TestIdempotence();

    std::cout << "[PASS] Field Extractor Test." << std::endl;
    return 0;
}
