/**
 * @file JsonMapping.hpp
 * @brief Manual JSON mapping for requests, policies and verification reports.
 *
 * Keys are camelCase to match the public web API.
 */

#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "application/VerificationService.hpp"
#include "domain/CheckResult.hpp"
#include "domain/ConfidenceField.hpp"
#include "domain/EligibilityPolicy.hpp"
#include "domain/ExtractedDocument.hpp"
#include "domain/MrzRecord.hpp"

namespace docverify::infrastructure {

class JsonMapping {
public:
    /**
     * @brief Reads applicant claims. Missing keys become "" (intendedVisaType: "tourist").
     * @return std::nullopt if @p j is not an object or a present key has the wrong type.
     */
    static std::optional<domain::ApplicantData> ParseApplicant(const nlohmann::json& j);

    /**
     * @brief Reads a policy. Keys that are absent keep the value of @p defaults.
     * @return std::nullopt if @p j is not an object or a present key has the wrong type.
     */
    static std::optional<domain::EligibilityPolicy> ParsePolicy(const nlohmann::json& j,
                                                                const domain::EligibilityPolicy& defaults);

    static nlohmann::json ToJson(const domain::ConfidenceField& field);
    static nlohmann::json ToJson(const domain::ExtractedDocument& doc);
    static nlohmann::json ToJson(const domain::MrzRecord& record);
    static nlohmann::json ToJson(const domain::CheckResult& check);
    static nlohmann::json ToJson(const application::VerificationResult& result);
};

} // namespace docverify::infrastructure
