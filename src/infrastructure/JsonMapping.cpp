/**
 * @file JsonMapping.cpp
 * @brief Implementation of JsonMapping.
 */

#include "infrastructure/JsonMapping.hpp"

#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace docverify::infrastructure {

using json = nlohmann::json;

namespace {

std::set<std::string> ToSet(const json& j) {
    return j.get<std::set<std::string>>();
}

// A null value counts as absent.
std::string StringOr(const json& j, const char* key, const std::string& fallback) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return it->get<std::string>();
}

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

} // namespace

std::optional<domain::ApplicantData> JsonMapping::ParseApplicant(const json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        domain::ApplicantData applicant;
        applicant.name = StringOr(j, "name", "");
        applicant.dateOfBirth = StringOr(j, "dateOfBirth", "");
        applicant.passportNumber = StringOr(j, "passportNumber", "");
        applicant.nationality = StringOr(j, "nationality", "");
        applicant.intendedVisaType = StringOr(j, "intendedVisaType", "tourist");
        return applicant;
    } catch (const json::exception& e) {
        std::cerr << "[JsonMapping] Invalid applicant data: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::EligibilityPolicy> JsonMapping::ParsePolicy(const json& j,
                                                                  const domain::EligibilityPolicy& defaults) {
    if (!j.is_object()) return std::nullopt;
    try {
        domain::EligibilityPolicy policy = defaults;
        policy.minAge = j.value("minAge", defaults.minAge);
        policy.maxAge = j.value("maxAge", defaults.maxAge);
        policy.minValidityMonths = j.value("minValidityMonths", defaults.minValidityMonths);
        if (j.contains("allowedNationalities")) policy.allowedNationalities = ToSet(j["allowedNationalities"]);
        if (j.contains("blockedNationalities")) policy.blockedNationalities = ToSet(j["blockedNationalities"]);
        if (j.contains("requiredDocumentTypes")) policy.requiredDocumentTypes = ToSet(j["requiredDocumentTypes"]);

        if (j.contains("visaTypeRequirements")) {
            const auto& visaTypes = j["visaTypeRequirements"];
            if (!visaTypes.is_object()) return std::nullopt;
            policy.visaTypeRequirements.clear();
            for (const auto& [visaType, entry] : visaTypes.items()) {
                if (!entry.is_object()) return std::nullopt;
                domain::VisaTypeRequirement requirement;
                if (entry.contains("minAge")) requirement.minAge = entry["minAge"].get<int>();
                if (entry.contains("allowedNationalities")) {
                    requirement.allowedNationalities = ToSet(entry["allowedNationalities"]);
                }
                if (entry.contains("additionalRequirements")) {
                    requirement.additionalRequirements = entry["additionalRequirements"].get<std::vector<std::string>>();
                }
                policy.visaTypeRequirements[visaType] = std::move(requirement);
            }
        }
        return policy;
    } catch (const json::exception& e) {
        std::cerr << "[JsonMapping] Invalid eligibility policy: " << e.what() << std::endl;
    }
    return std::nullopt;
}

json JsonMapping::ToJson(const domain::ConfidenceField& field) {
    return {
        {"value", field.value},
        {"confidence", field.confidence},
        {"source", domain::FieldSourceToString(field.source)}
    };
}

json JsonMapping::ToJson(const domain::ExtractedDocument& doc) {
    json j = {
        {"documentType", ToJson(doc.documentType)},
        {"documentNumber", ToJson(doc.documentNumber)},
        {"surname", ToJson(doc.surname)},
        {"givenNames", ToJson(doc.givenNames)},
        {"nationality", ToJson(doc.nationality)},
        {"dateOfBirth", ToJson(doc.dateOfBirth)},
        {"sex", ToJson(doc.sex)},
        {"issuingCountry", ToJson(doc.issuingCountry)},
        {"issueDate", ToJson(doc.issueDate)},
        {"expiryDate", ToJson(doc.expiryDate)}
    };
    if (doc.placeOfBirth) j["placeOfBirth"] = ToJson(*doc.placeOfBirth);
    if (doc.mrzLine1) j["mrzLine1"] = ToJson(*doc.mrzLine1);
    if (doc.mrzLine2) j["mrzLine2"] = ToJson(*doc.mrzLine2);
    if (doc.mrzLine3) j["mrzLine3"] = ToJson(*doc.mrzLine3);
    return j;
}

json JsonMapping::ToJson(const domain::MrzRecord& record) {
    json parsed = json::object();
    PutOptional(parsed, "documentType", record.documentType);
    PutOptional(parsed, "issuingCountry", record.issuingCountry);
    PutOptional(parsed, "documentNumber", record.documentNumber);
    PutOptional(parsed, "surname", record.surname);
    PutOptional(parsed, "givenNames", record.givenNames);
    PutOptional(parsed, "nationality", record.nationality);
    PutOptional(parsed, "dateOfBirth", record.dateOfBirth);
    PutOptional(parsed, "sex", record.sex);
    PutOptional(parsed, "expiryDate", record.expiryDate);
    PutOptional(parsed, "personalNumber", record.personalNumber);

    json j = {
        {"valid", record.valid},
        {"errors", record.errors},
        {"lines", record.lines},
        {"parsedData", parsed}
    };
    j["layout"] = record.layout ? json(domain::LayoutToString(*record.layout)) : json(nullptr);
    return j;
}

json JsonMapping::ToJson(const domain::CheckResult& check) {
    return {
        {"check", check.check},
        {"passed", check.passed},
        {"message", check.message}
    };
}

json JsonMapping::ToJson(const application::VerificationResult& result) {
    json validation = json::array();
    for (const auto& check : result.validationChecks) validation.push_back(ToJson(check));
    json eligibility = json::array();
    for (const auto& check : result.eligibilityChecks) eligibility.push_back(ToJson(check));

    return {
        {"overallConfidence", result.overallConfidence},
        {"extractedData", ToJson(result.extractedData)},
        {"validationChecks", validation},
        {"eligibilityChecks", eligibility},
        {"recommendedActions", result.recommendedActions},
        {"summary", result.summary}
    };
}

} // namespace docverify::infrastructure
