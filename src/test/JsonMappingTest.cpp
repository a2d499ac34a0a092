#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "application/DefaultPolicy.hpp"
#include "domain/mrz/MrzCodec.hpp"
#include "infrastructure/JsonMapping.hpp"

using namespace docverify::domain;
using namespace docverify::application;
using docverify::infrastructure::JsonMapping;
using json = nlohmann::json;

namespace {

void TestParseApplicant() {
    std::cout << "[Test] Applicant parsing..." << std::endl;
    const auto full = JsonMapping::ParseApplicant(json{
        {"name", "John Smith"},
        {"dateOfBirth", "1990-05-15"},
        {"passportNumber", "AB1234567"},
        {"nationality", "GBR"},
        {"intendedVisaType", "business"}
    });
    assert(full.has_value());
    assert(full->name == "John Smith");
    assert(full->dateOfBirth == "1990-05-15");
    assert(full->passportNumber == "AB1234567");
    assert(full->nationality == "GBR");
    assert(full->intendedVisaType == "business");

    const auto sparse = JsonMapping::ParseApplicant(json{{"name", "Jane"}});
    assert(sparse.has_value());
    assert(sparse->dateOfBirth.empty());
    assert(sparse->intendedVisaType == "tourist");

    const auto nulls = JsonMapping::ParseApplicant(json{
        {"name", "Jane"},
        {"dateOfBirth", nullptr},
        {"passportNumber", nullptr},
        {"intendedVisaType", nullptr}
    });
    assert(nulls.has_value());
    assert(nulls->name == "Jane");
    assert(nulls->dateOfBirth.empty());
    assert(nulls->passportNumber.empty());
    assert(nulls->intendedVisaType == "tourist");

    assert(!JsonMapping::ParseApplicant(json{{"name", 42}}).has_value());
    assert(!JsonMapping::ParseApplicant(json::array()).has_value());
    assert(!JsonMapping::ParseApplicant(json("John")).has_value());
}

void TestParsePolicy() {
    std::cout << "[Test] Policy parsing..." << std::endl;
    const auto defaults = DefaultEligibilityPolicy();

    const auto unchanged = JsonMapping::ParsePolicy(json::object(), defaults);
    assert(unchanged.has_value());
    assert(unchanged->minAge == 18);
    assert(unchanged->blockedNationalities == defaults.blockedNationalities);
    assert(unchanged->visaTypeRequirements.size() == 4);

    const auto custom = JsonMapping::ParsePolicy(json::parse(R"({
        "minAge": 21,
        "maxAge": 70,
        "allowedNationalities": ["GBR", "IRL"],
        "blockedNationalities": [],
        "requiredDocumentTypes": ["P"],
        "minValidityMonths": 3
    })"), defaults);
    assert(custom.has_value());
    assert(custom->minAge == 21);
    assert(custom->maxAge == 70);
    assert(custom->allowedNationalities.size() == 2);
    assert(custom->allowedNationalities.count("IRL") == 1);
    assert(custom->blockedNationalities.empty());
    assert(custom->requiredDocumentTypes.size() == 1);
    assert(custom->minValidityMonths == 3);
    // Absent keys keep the defaults.
    assert(custom->visaTypeRequirements.size() == 4);

    const auto visas = JsonMapping::ParsePolicy(json::parse(R"({
        "visaTypeRequirements": {
            "work": {"minAge": 20, "allowedNationalities": ["GBR"], "additionalRequirements": ["Work permit"]},
            "transit": {}
        }
    })"), defaults);
    assert(visas.has_value());
    assert(visas->visaTypeRequirements.size() == 2);
    const auto* work = visas->FindVisaType("work");
    assert(work && work->minAge == 20);
    assert(work->allowedNationalities && work->allowedNationalities->count("GBR") == 1);
    assert(work->additionalRequirements.size() == 1);
    const auto* transit = visas->FindVisaType("transit");
    assert(transit && !transit->minAge && !transit->allowedNationalities);
    assert(!visas->FindVisaType("tourist"));

    assert(!JsonMapping::ParsePolicy(json{{"minAge", "eighteen"}}, defaults).has_value());
    assert(!JsonMapping::ParsePolicy(json{{"allowedNationalities", "GBR"}}, defaults).has_value());
    assert(!JsonMapping::ParsePolicy(json{{"visaTypeRequirements", json::array()}}, defaults).has_value());
    assert(!JsonMapping::ParsePolicy(json{{"visaTypeRequirements", {{"work", 5}}}}, defaults).has_value());
    assert(!JsonMapping::ParsePolicy(json::array(), defaults).has_value());
}

void TestDocumentToJson() {
    std::cout << "[Test] Extracted document to JSON..." << std::endl;
    ExtractedDocument doc;
    doc.documentType = ConfidenceField("P", 95, FieldSource::MrzVerified);
    doc.documentNumber = ConfidenceField("AB1234567", 60, FieldSource::MrzUnverified);
    doc.dateOfBirth = ConfidenceField("2024-06-01", 70, FieldSource::Placeholder);

    const json j = JsonMapping::ToJson(doc);
    assert(j["documentType"]["value"] == "P");
    assert(j["documentType"]["confidence"] == 95);
    assert(j["documentType"]["source"] == "mrz-verified");
    assert(j["documentNumber"]["source"] == "mrz-unverified");
    assert(j["dateOfBirth"]["source"] == "placeholder");
    assert(j["surname"]["source"] == "heuristic");
    assert(j.contains("issuingCountry") && j.contains("issueDate") && j.contains("expiryDate"));
    assert(!j.contains("placeOfBirth"));
    assert(!j.contains("mrzLine1"));

    doc.placeOfBirth = ConfidenceField("LONDON", 70);
    doc.mrzLine1 = ConfidenceField("P<", 95, FieldSource::MrzVerified);
    const json withOptional = JsonMapping::ToJson(doc);
    assert(withOptional["placeOfBirth"]["value"] == "LONDON");
    assert(withOptional["mrzLine1"]["confidence"] == 95);
    assert(!withOptional.contains("mrzLine3"));
}

void TestMrzRecordToJson() {
    std::cout << "[Test] MRZ record to JSON..." << std::endl;
    const auto record = mrz::MrzCodec::Parse({
        "P<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<<<<<<<<<",
        "L898902C36UTO7408122F1204159ZE184226B<<<<<10"
    });
    const json j = JsonMapping::ToJson(record);
    assert(j["valid"] == true);
    assert(j["errors"].empty());
    assert(j["lines"].size() == 2);
    assert(j["layout"] == "TD3");
    assert(j["parsedData"]["documentNumber"] == "L898902C3");
    assert(j["parsedData"]["givenNames"] == "ANNA MARIA");
    assert(j["parsedData"]["personalNumber"] == "ZE184226B");

    const json invalid = JsonMapping::ToJson(mrz::MrzCodec::Parse({}));
    assert(invalid["valid"] == false);
    assert(invalid["layout"].is_null());
    assert(invalid["errors"].size() == 1);
    assert(invalid["parsedData"].empty());
}

void TestResultToJson() {
    std::cout << "[Test] Verification result to JSON..." << std::endl;
    VerificationResult result;
    result.overallConfidence = 91;
    result.validationChecks.push_back(CheckResult::Pass("Document Expiry", "Document valid until 2030-01-01"));
    result.eligibilityChecks.push_back(CheckResult::Fail("Nationality Eligibility", "Nationality PRK is not eligible for visa"));
    result.recommendedActions.push_back("Address eligibility issues: Nationality Eligibility");
    result.summary = "Eligibility check failed.";

    const json j = JsonMapping::ToJson(result);
    assert(j["overallConfidence"] == 91);
    assert(j["extractedData"].is_object());
    assert(j["validationChecks"].size() == 1);
    assert(j["validationChecks"][0]["check"] == "Document Expiry");
    assert(j["validationChecks"][0]["passed"] == true);
    assert(j["eligibilityChecks"][0]["passed"] == false);
    assert(j["eligibilityChecks"][0]["message"] == "Nationality PRK is not eligible for visa");
    assert(j["recommendedActions"][0] == "Address eligibility issues: Nationality Eligibility");
    assert(j["summary"] == "Eligibility check failed.");

    const json empty = JsonMapping::ToJson(VerificationResult{});
    assert(empty["validationChecks"].is_array() && empty["validationChecks"].empty());
    assert(empty["recommendedActions"].is_array());
}

} // namespace

int main() {
    std::cout << "[Test] Starting JSON Mapping Test..." << std::endl;

    TestParseApplicant();
    TestParsePolicy();
    TestDocumentToJson();
    TestMrzRecordToJson();
    TestResultToJson();

    std::cout << "[PASS] JSON Mapping Test." << std::endl;
    return 0;
}
