#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "application/DefaultPolicy.hpp"
#include "application/VerificationService.hpp"

using namespace docverify::domain;
using namespace docverify::application;

namespace {

const std::string kGbrLine1 = "P<GBRSMITH<<JOHN<<<<<<<<<<<<<<<<<<<<<<<<<<<<";
const std::string kGbrLine2 = "AB12345671GBR9005156M3001019<<<<<<<<<<<<<<<0";
const std::string kPrkLine1 = "P<PRKSMITH<<JOHN<<<<<<<<<<<<<<<<<<<<<<<<<<<<";
const std::string kPrkLine2 = "AB12345671PRK9005156M3001019<<<<<<<<<<<<<<<0";

const std::string kHeader =
    "PASSPORT\n"
    "Date of Issue: 2020-01-10\n"
    "Place of Birth: London\n";

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

const CalendarDate kToday = Day("2024-06-01");

// Mock OCR engine returning canned text.
class MockOcrEngine : public OcrEngine {
public:
    explicit MockOcrEngine(std::string text, bool success = true)
        : m_text(std::move(text)), m_success(success) {}

    RecognitionResult recognize(const std::vector<unsigned char>& imageBytes) override {
        ++calls;
        lastSize = imageBytes.size();
        RecognitionResult result;
        result.success = m_success;
        result.method = "mock";
        if (m_success) {
            result.text = m_text;
        } else {
            result.warnings.push_back("tesseract not found");
        }
        return result;
    }

    int calls = 0;
    size_t lastSize = 0;

private:
    std::string m_text;
    bool m_success;
};

ApplicantData MakeApplicant() {
    ApplicantData applicant;
    applicant.name = "John Smith";
    applicant.dateOfBirth = "1990-05-15";
    applicant.passportNumber = "AB1234567";
    applicant.nationality = "GBR";
    return applicant;
}

bool AllPassed(const std::vector<CheckResult>& checks) {
    for (const auto& check : checks) {
        if (!check.passed) return false;
    }
    return true;
}

void TestVerifiedMrzPipeline() {
    std::cout << "[Test] Valid MRZ runs the whole pipeline..." << std::endl;
    VerificationService service(nullptr, DefaultEligibilityPolicy());
    const std::string text = kHeader + kGbrLine1 + "\n" + kGbrLine2 + "\n";
    const auto result = service.VerifyText(text, MakeApplicant(), service.defaultPolicy(), kToday);

    const auto& doc = result.extractedData;
    assert(doc.documentNumber == ConfidenceField("AB1234567", 95, FieldSource::MrzVerified));
    assert(doc.dateOfBirth.value == "1990-05-15");
    assert(doc.expiryDate.value == "2030-01-01");
    assert(doc.issueDate == ConfidenceField("2020-01-10", 70, FieldSource::Heuristic));
    assert(doc.placeOfBirth == ConfidenceField("LONDON", 70, FieldSource::Heuristic));
    assert(doc.mrzLine1 && doc.mrzLine2 && !doc.mrzLine3);

    assert(result.validationChecks.size() == 7);
    assert(result.eligibilityChecks.size() == 9);
    assert(AllPassed(result.validationChecks));
    assert(AllPassed(result.eligibilityChecks));

    // 11 fields at 95 and 2 at 70.
    assert(result.overallConfidence == 91);
    assert(result.recommendedActions.size() == 1);
    assert(result.recommendedActions[0] == "Proceed with visa application - all checks passed");
    assert(result.summary == "Document verification successful. P document AB1234567 for JOHN SMITH passed all "
                             "validation and eligibility checks with 91% confidence. Application is ready to proceed.");
}

void TestBlockedNationality() {
    std::cout << "[Test] Blocked nationality fails eligibility only..." << std::endl;
    VerificationService service(nullptr, DefaultEligibilityPolicy());
    auto applicant = MakeApplicant();
    applicant.nationality = "PRK";

    const std::string text = kHeader + kPrkLine1 + "\n" + kPrkLine2 + "\n";
    const auto result = service.VerifyText(text, applicant, service.defaultPolicy(), kToday);

    assert(AllPassed(result.validationChecks));
    for (const auto& check : result.eligibilityChecks) {
        assert(check.passed == (check.check != "Nationality Eligibility"));
    }
    assert(result.recommendedActions.size() == 1);
    assert(result.recommendedActions[0] == "Address eligibility issues: Nationality Eligibility");
    assert(result.summary == "Eligibility check failed. P document AB1234567 for JOHN SMITH does not meet "
                             "eligibility requirements for visa application. Failed 1 check(s): Nationality Eligibility.");
}

void TestHeuristicOnlyPipeline() {
    std::cout << "[Test] Text without MRZ is scored lower..." << std::endl;
    VerificationService service(nullptr, DefaultEligibilityPolicy());
    auto applicant = MakeApplicant();
    applicant.name = "John Paul Smith";

    const auto result = service.VerifyText(kFreeText, applicant, service.defaultPolicy(), kToday);
    assert(!result.extractedData.mrzLine1.has_value());
    assert(AllPassed(result.validationChecks));
    assert(AllPassed(result.eligibilityChecks));
    assert(result.overallConfidence == 75);
    assert(result.recommendedActions.size() == 1);
    assert(result.recommendedActions[0] == "Consider requesting clearer document images for higher confidence");
    assert(result.summary == "Document verification completed with 75% confidence. P document AB1234567 for "
                             "JOHN PAUL SMITH. Review recommended actions before proceeding.");
}

void TestVerifyWithOcr() {
    std::cout << "[Test] Verify runs OCR on the image bytes..." << std::endl;
    auto ocr = std::make_shared<MockOcrEngine>(kHeader + kGbrLine1 + "\n" + kGbrLine2 + "\n");
    VerificationService service(ocr, DefaultEligibilityPolicy());

    VerificationRequest request;
    request.imageBytes = {0x89, 'P', 'N', 'G'};
    request.applicant = MakeApplicant();

    const auto result = service.Verify(request, kToday);
    assert(ocr->calls == 1);
    assert(ocr->lastSize == 4);
    assert(result.overallConfidence == 91);
    assert(AllPassed(result.eligibilityChecks));

    // A request policy replaces the default one.
    EligibilityPolicy strict = DefaultEligibilityPolicy();
    strict.blockedNationalities.insert("GBR");
    request.policy = strict;
    const auto blocked = service.Verify(request, kToday);
    assert(!blocked.eligibilityChecks[5].passed);
    assert(blocked.eligibilityChecks[5].message == "Nationality GBR is not eligible for visa");
    assert(service.defaultPolicy().blockedNationalities.count("GBR") == 0);
}

void TestVerifyFailures() {
    std::cout << "[Test] Verify failures raise..." << std::endl;
    VerificationRequest request;
    request.applicant = MakeApplicant();
    request.imageBytes = {1, 2, 3};

    VerificationService noEngine(nullptr, DefaultEligibilityPolicy());
    bool thrown = false;
    try {
        noEngine.Verify(request, kToday);
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()) == "No OCR engine configured";
    }
    assert(thrown);

    auto failing = std::make_shared<MockOcrEngine>("", false);
    VerificationService service(failing, DefaultEligibilityPolicy());
    thrown = false;
    try {
        service.Verify(request, kToday);
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()) == "OCR failed: tesseract not found";
    }
    assert(thrown);

    request.imageBytes.clear();
    thrown = false;
    try {
        service.Verify(request, kToday);
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()) == "Image data is empty";
    }
    assert(thrown);
    assert(failing->calls == 1);
}

void TestOverallConfidence() {
    std::cout << "[Test] Overall confidence..." << std::endl;
    ExtractedDocument doc;
    doc.documentType = ConfidenceField("P", 95);
    doc.documentNumber = ConfidenceField("AB1234567", 95);
    doc.surname = ConfidenceField("SMITH", 95);
    doc.givenNames = ConfidenceField("JOHN", 95);
    doc.nationality = ConfidenceField("GBR", 95);
    doc.dateOfBirth = ConfidenceField("1990-05-15", 95);
    doc.sex = ConfidenceField("M", 95);
    doc.issuingCountry = ConfidenceField("GBR", 95);
    doc.issueDate = ConfidenceField("2020-01-10", 70);
    doc.expiryDate = ConfidenceField("2030-01-09", 95);

    // 925 / 10 rounds half up.
    assert(VerificationService::CalculateOverallConfidence(doc) == 93);

    // 995 / 11 rounds down.
    doc.placeOfBirth = ConfidenceField("LONDON", 70);
    assert(VerificationService::CalculateOverallConfidence(doc) == 90);
}

void TestRecommendationsAndSummary() {
    std::cout << "[Test] Recommendations and summary..." << std::endl;
    ExtractedDocument doc;
    doc.documentType = ConfidenceField("P", 80);
    doc.documentNumber = ConfidenceField("X12345678", 75);
    doc.surname = ConfidenceField("DOE", 75);
    doc.givenNames = ConfidenceField("JANE", 75);

    const std::vector<CheckResult> failedValidation = {
        CheckResult::Pass("Date Format Validation", "ok"),
        CheckResult::Fail("Document Expiry", "Document expired on 2000-01-01")
    };
    const std::vector<CheckResult> failedEligibility = {
        CheckResult::Fail("Validity Period", "Document only valid for -298 months, requires 6")
    };
    const std::vector<CheckResult> passed = {CheckResult::Pass("Name Match", "ok")};

    auto actions = VerificationService::RecommendActions(failedValidation, failedEligibility, 60);
    assert(actions.size() == 3);
    assert(actions[0] == "Review failed validation checks: Document Expiry");
    assert(actions[1] == "Address eligibility issues: Validity Period");
    assert(actions[2] == "Request manual verification due to low confidence in extracted data");

    assert(VerificationService::Summarize(doc, failedValidation, failedEligibility, 60) ==
           "Document verification flagged issues. P document X12345678 for JANE DOE failed 1 validation "
           "check(s): Document Expiry. Manual review required.");

    actions = VerificationService::RecommendActions(passed, passed, 60);
    assert(actions.size() == 2);
    assert(actions[0] == "Request manual verification due to low confidence in extracted data");
    assert(actions[1] == "Consider requesting clearer document images for higher confidence");
    assert(VerificationService::Summarize(doc, passed, passed, 60) ==
           "Low confidence verification. P document X12345678 for JANE DOE extracted with only 60% "
           "confidence. Request clearer images or manual verification.");

    actions = VerificationService::RecommendActions(passed, passed, 85);
    assert(actions.size() == 1);
    assert(actions[0] == "Proceed with visa application - all checks passed");

    actions = VerificationService::RecommendActions(passed, failedEligibility, 90);
    assert(actions.size() == 1);
    assert(actions[0] == "Address eligibility issues: Validity Period");
}

} // namespace

int main() {
    std::cout << "[Test] Starting Verification Service Test..." << std::endl;

    TestVerifiedMrzPipeline();
    TestBlockedNationality();
    TestHeuristicOnlyPipeline();
    TestVerifyWithOcr();
    TestVerifyFailures();
    TestOverallConfidence();
    TestRecommendationsAndSummary();

    std::cout << "[PASS] Verification Service Test." << std::endl;
    return 0;
}
