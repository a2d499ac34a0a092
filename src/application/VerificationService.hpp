/**
 * @file VerificationService.hpp
 * @brief Application service running the full verification pipeline for one request.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/DocumentValidator.hpp"
#include "application/EligibilityChecker.hpp"
#include "application/FieldExtractor.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/CheckResult.hpp"
#include "domain/EligibilityPolicy.hpp"
#include "domain/ExtractedDocument.hpp"
#include "domain/OcrEngine.hpp"

namespace docverify::application {

/**
 * @struct VerificationRequest
 * @brief One document image plus the applicant's claims.
 */
struct VerificationRequest {
    std::vector<unsigned char> imageBytes;
    domain::ApplicantData applicant;
    std::optional<domain::EligibilityPolicy> policy; ///< Falls back to the service default.
};

/**
 * @struct VerificationResult
 * @brief Aggregate report returned to the caller.
 */
struct VerificationResult {
    int overallConfidence = 0;
    domain::ExtractedDocument extractedData;
    std::vector<domain::ValidationCheck> validationChecks;
    std::vector<domain::EligibilityCheck> eligibilityChecks;
    std::vector<std::string> recommendedActions;
    std::string summary;
};

/**
 * @class VerificationService
 * @brief OCR -> MRZ codec -> field extractor -> both check batteries -> report.
 *
 * Holds no per-request state; one instance may serve concurrent requests as long as
 * the OCR engine does.
 */
class VerificationService {
public:
    /** @brief Overall confidence below this asks for manual verification. */
    static constexpr int LowConfidenceThreshold = 70;
    /** @brief Overall confidence needed to proceed without asking for better images. */
    static constexpr int HighConfidenceThreshold = 85;

    /**
     * @param ocr Engine used by Verify(). May be null when only VerifyText() is used.
     * @param defaultPolicy Policy applied when a request carries none.
     * @param options Extraction behavior (missing-date placeholder).
     */
    VerificationService(std::shared_ptr<domain::OcrEngine> ocr,
                        domain::EligibilityPolicy defaultPolicy,
                        ExtractionOptions options = {});

    /**
     * @brief Recognizes the image and verifies the resulting text.
     * @throws std::runtime_error if there is no OCR engine, the image is empty or OCR fails.
     */
    VerificationResult Verify(const VerificationRequest& request) const;
    VerificationResult Verify(const VerificationRequest& request, const domain::CalendarDate& today) const;

    /** @brief Runs the pipeline on already-recognized text. */
    VerificationResult VerifyText(const std::string& rawText,
                                  const domain::ApplicantData& applicant,
                                  const domain::EligibilityPolicy& policy) const;
    VerificationResult VerifyText(const std::string& rawText,
                                  const domain::ApplicantData& applicant,
                                  const domain::EligibilityPolicy& policy,
                                  const domain::CalendarDate& today) const;

    const domain::EligibilityPolicy& defaultPolicy() const { return m_defaultPolicy; }

    /** @brief Rounded mean confidence over every present field. */
    static int CalculateOverallConfidence(const domain::ExtractedDocument& doc);

    static std::vector<std::string> RecommendActions(const std::vector<domain::ValidationCheck>& validation,
                                                     const std::vector<domain::EligibilityCheck>& eligibility,
                                                     int overallConfidence);

    static std::string Summarize(const domain::ExtractedDocument& doc,
                                 const std::vector<domain::ValidationCheck>& validation,
                                 const std::vector<domain::EligibilityCheck>& eligibility,
                                 int overallConfidence);

private:
    std::shared_ptr<domain::OcrEngine> m_ocr;
    domain::EligibilityPolicy m_defaultPolicy;
    FieldExtractor m_extractor;
    DocumentValidator m_validator;
    EligibilityChecker m_eligibility;
};

} // namespace docverify::application
