/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application settings (settings.json) and policy files.
 *
 * Keeps JSON parsing of configuration in one place. Missing files and keys fall back
 * to defaults; malformed files are reported on stderr and also fall back.
 */

#pragma once

#include <optional>
#include <string>

#include "application/FieldExtractor.hpp"
#include "domain/EligibilityPolicy.hpp"

namespace docverify::infrastructure {

/**
 * @struct AppConfig
 * @brief Values read from settings.json.
 */
struct AppConfig {
    std::string tesseractPath = "tesseract";
    std::string ocrLanguage = "eng";
    std::string serverHost = "0.0.0.0";
    int serverPort = 8080;
    std::optional<std::string> policyPath;   ///< JSON policy file; built-in policy if unset.
    application::MissingDatePolicy missingDate = application::MissingDatePolicy::Today;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param settingsPath Path to the file. A missing file yields the defaults.
     */
    static AppConfig LoadAppConfig(const std::string& settingsPath);

    /**
     * @brief Reads a policy file on top of the built-in default policy.
     * @return std::nullopt if the file is missing, malformed or has mistyped keys.
     */
    static std::optional<domain::EligibilityPolicy> LoadPolicy(const std::string& policyPath);

    /** @brief Policy from config.policyPath when it loads, the built-in default otherwise. */
    static domain::EligibilityPolicy ResolvePolicy(const AppConfig& config);
};

} // namespace docverify::infrastructure
