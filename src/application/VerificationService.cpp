/**
 * @file VerificationService.cpp
 * @brief Implementation of VerificationService.
 */

#include "application/VerificationService.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "domain/mrz/MrzCodec.hpp"

namespace docverify::application {

using domain::CalendarDate;
using domain::CheckResult;
using domain::ExtractedDocument;

namespace {

std::vector<std::string> FailedNames(const std::vector<CheckResult>& checks) {
    std::vector<std::string> names;
    for (const auto& check : checks) {
        if (!check.passed) names.push_back(check.check);
    }
    return names;
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

} // namespace

VerificationService::VerificationService(std::shared_ptr<domain::OcrEngine> ocr,
                                         domain::EligibilityPolicy defaultPolicy,
                                         ExtractionOptions options)
    : m_ocr(std::move(ocr)),
      m_defaultPolicy(std::move(defaultPolicy)),
      m_extractor(options) {}

VerificationResult VerificationService::Verify(const VerificationRequest& request) const {
    return Verify(request, CalendarDate::Today());
}

VerificationResult VerificationService::Verify(const VerificationRequest& request, const CalendarDate& today) const {
    if (!m_ocr) {
        throw std::runtime_error("No OCR engine configured");
    }
    if (request.imageBytes.empty()) {
        throw std::runtime_error("Image data is empty");
    }

    std::cout << "[VerificationService] Running OCR on " << request.imageBytes.size() << " bytes..." << std::endl;
    const auto recognition = m_ocr->recognize(request.imageBytes);
    if (!recognition.success) {
        std::string reason = recognition.warnings.empty() ? "no text recognized" : JoinNames(recognition.warnings);
        std::cerr << "[VerificationService] OCR failed: " << reason << std::endl;
        throw std::runtime_error("OCR failed: " + reason);
    }
    std::cout << "[VerificationService] OCR done via " << recognition.method
              << " (" << recognition.text.size() << " chars)" << std::endl;

    const auto& policy = request.policy ? *request.policy : m_defaultPolicy;
    return VerifyText(recognition.text, request.applicant, policy, today);
}

VerificationResult VerificationService::VerifyText(const std::string& rawText,
                                                   const domain::ApplicantData& applicant,
                                                   const domain::EligibilityPolicy& policy) const {
    return VerifyText(rawText, applicant, policy, CalendarDate::Today());
}

VerificationResult VerificationService::VerifyText(const std::string& rawText,
                                                   const domain::ApplicantData& applicant,
                                                   const domain::EligibilityPolicy& policy,
                                                   const CalendarDate& today) const {
    // Only text that actually holds MRZ-shaped lines feeds a record to the extractor.
    std::optional<domain::MrzRecord> mrz;
    const auto candidates = domain::mrz::MrzCodec::DetectLines(rawText).ToVector();
    if (!candidates.empty()) {
        mrz = domain::mrz::MrzCodec::Parse(candidates);
        if (!mrz->valid) {
            std::cout << "[VerificationService] MRZ found with " << mrz->errors.size() << " error(s)" << std::endl;
        }
    }

    VerificationResult result;
    result.extractedData = m_extractor.Extract(rawText, mrz, today);
    result.validationChecks = m_validator.Validate(result.extractedData, today);
    result.eligibilityChecks = m_eligibility.Check(result.extractedData, applicant, policy, today);
    result.overallConfidence = CalculateOverallConfidence(result.extractedData);
    result.recommendedActions = RecommendActions(result.validationChecks, result.eligibilityChecks, result.overallConfidence);
    result.summary = Summarize(result.extractedData, result.validationChecks, result.eligibilityChecks, result.overallConfidence);
    return result;
}

int VerificationService::CalculateOverallConfidence(const ExtractedDocument& doc) {
    const auto fields = doc.PresentFields();
    if (fields.empty()) return 0;
    double total = 0.0;
    for (const auto* field : fields) {
        total += field->confidence;
    }
    return static_cast<int>(std::lround(total / static_cast<double>(fields.size())));
}

std::vector<std::string> VerificationService::RecommendActions(const std::vector<domain::ValidationCheck>& validation,
                                                               const std::vector<domain::EligibilityCheck>& eligibility,
                                                               int overallConfidence) {
    std::vector<std::string> actions;
    const auto failedValidation = FailedNames(validation);
    const auto failedEligibility = FailedNames(eligibility);
    const bool allPassed = failedValidation.empty() && failedEligibility.empty();

    if (!failedValidation.empty()) {
        actions.push_back("Review failed validation checks: " + JoinNames(failedValidation));
    }
    if (!failedEligibility.empty()) {
        actions.push_back("Address eligibility issues: " + JoinNames(failedEligibility));
    }
    if (overallConfidence < LowConfidenceThreshold) {
        actions.push_back("Request manual verification due to low confidence in extracted data");
    }
    if (overallConfidence < HighConfidenceThreshold && allPassed) {
        actions.push_back("Consider requesting clearer document images for higher confidence");
    }
    if (allPassed && overallConfidence >= HighConfidenceThreshold) {
        actions.push_back("Proceed with visa application - all checks passed");
    }

    if (actions.empty()) {
        actions.push_back("Review application manually before proceeding");
    }
    return actions;
}

std::string VerificationService::Summarize(const ExtractedDocument& doc,
                                           const std::vector<domain::ValidationCheck>& validation,
                                           const std::vector<domain::EligibilityCheck>& eligibility,
                                           int overallConfidence) {
    const auto failedValidation = FailedNames(validation);
    const auto failedEligibility = FailedNames(eligibility);
    const std::string subject = doc.documentType.value + " document " + doc.documentNumber.value +
                                " for " + doc.HolderName();
    const std::string confidence = std::to_string(overallConfidence) + "%";

    if (failedValidation.empty() && failedEligibility.empty() && overallConfidence >= HighConfidenceThreshold) {
        return "Document verification successful. " + subject +
               " passed all validation and eligibility checks with " + confidence +
               " confidence. Application is ready to proceed.";
    }
    if (!failedValidation.empty()) {
        return "Document verification flagged issues. " + subject + " failed " +
               std::to_string(failedValidation.size()) + " validation check(s): " +
               JoinNames(failedValidation) + ". Manual review required.";
    }
    if (!failedEligibility.empty()) {
        return "Eligibility check failed. " + subject +
               " does not meet eligibility requirements for visa application. Failed " +
               std::to_string(failedEligibility.size()) + " check(s): " + JoinNames(failedEligibility) + ".";
    }
    if (overallConfidence < LowConfidenceThreshold) {
        return "Low confidence verification. " + subject + " extracted with only " + confidence +
               " confidence. Request clearer images or manual verification.";
    }
    return "Document verification completed with " + confidence + " confidence. " + subject +
           ". Review recommended actions before proceeding.";
}

} // namespace docverify::application
