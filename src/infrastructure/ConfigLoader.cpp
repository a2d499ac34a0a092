/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "application/DefaultPolicy.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace docverify::infrastructure {

AppConfig ConfigLoader::LoadAppConfig(const std::string& settingsPath) {
    AppConfig config;
    if (!std::filesystem::exists(settingsPath)) {
        return config;
    }

    try {
        std::ifstream f(settingsPath);
        nlohmann::json j;
        f >> j;

        config.tesseractPath = j.value("tesseract_path", config.tesseractPath);
        config.ocrLanguage = j.value("ocr_language", config.ocrLanguage);
        config.serverHost = j.value("server_host", config.serverHost);
        config.serverPort = j.value("server_port", config.serverPort);
        if (j.contains("policy_path")) {
            config.policyPath = j["policy_path"].get<std::string>();
        }
        const std::string placeholder = j.value("missing_date_placeholder", std::string("today"));
        if (placeholder == "empty") {
            config.missingDate = application::MissingDatePolicy::Empty;
        } else if (placeholder != "today") {
            std::cerr << "[ConfigLoader] Unknown missing_date_placeholder '" << placeholder
                      << "', using 'today'" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
        return AppConfig{};
    }

    return config;
}

std::optional<domain::EligibilityPolicy> ConfigLoader::LoadPolicy(const std::string& policyPath) {
    if (!std::filesystem::exists(policyPath)) {
        std::cerr << "[ConfigLoader] Policy file not found: " << policyPath << std::endl;
        return std::nullopt;
    }

    try {
        std::ifstream f(policyPath);
        nlohmann::json j;
        f >> j;
        return JsonMapping::ParsePolicy(j, application::DefaultEligibilityPolicy());
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << policyPath << ": " << e.what() << std::endl;
    }

    return std::nullopt;
}

domain::EligibilityPolicy ConfigLoader::ResolvePolicy(const AppConfig& config) {
    if (config.policyPath) {
        if (auto policy = LoadPolicy(*config.policyPath)) {
            std::cout << "[ConfigLoader] Using policy from " << *config.policyPath << std::endl;
            return *policy;
        }
        std::cerr << "[ConfigLoader] Falling back to the built-in policy" << std::endl;
    }
    return application::DefaultEligibilityPolicy();
}

} // namespace docverify::infrastructure
