/**
 * @file DocVerifyApp.cpp
 * @brief Implementation of the DocVerify command line.
 */

#include "app/DocVerifyApp.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/VerificationService.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/mrz/MrzCodec.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/TesseractCliAdapter.hpp"
#include "infrastructure/VerifyHttpServer.hpp"

namespace docverify::app {

using json = nlohmann::json;

namespace {
constexpr const char* kDefaultSettings = "settings.json";
}

int DocVerifyApp::Run(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }

    const std::string command = argv[1];
    try {
        if (command == "verify") return RunVerify(argc, argv);
        if (command == "mrz") return RunMrz(argc, argv);
        if (command == "serve") return RunServe(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[DocVerify] Error: " << e.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return 1;
}

void DocVerifyApp::PrintUsage() const {
    std::cerr << "Usage:\n"
              << "  docverify verify (--image <file> | --text <file>) [--applicant <json>] [--policy <json>]\n"
              << "                   [--config <json>] [--today YYYY-MM-DD]\n"
              << "  docverify mrz --text <file>\n"
              << "  docverify serve [--config <json>] [--port N]" << std::endl;
}

std::optional<std::string> DocVerifyApp::FindArg(int argc, char** argv, const std::string& key) {
    for (int i = 2; i + 1 < argc; ++i) {
        if (key == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

std::optional<std::string> DocVerifyApp::ReadTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

infrastructure::AppConfig DocVerifyApp::LoadConfig(int argc, char** argv) const {
    return infrastructure::ConfigLoader::LoadAppConfig(FindArg(argc, argv, "--config").value_or(kDefaultSettings));
}

int DocVerifyApp::RunVerify(int argc, char** argv) {
    const auto imagePath = FindArg(argc, argv, "--image");
    const auto textPath = FindArg(argc, argv, "--text");
    if (imagePath.has_value() == textPath.has_value()) {
        PrintUsage();
        return 1;
    }

    const auto config = LoadConfig(argc, argv);

    domain::ApplicantData applicant;
    if (const auto applicantPath = FindArg(argc, argv, "--applicant")) {
        const auto content = ReadTextFile(*applicantPath);
        if (!content) {
            std::cerr << "[DocVerify] Cannot read applicant file: " << *applicantPath << std::endl;
            return 1;
        }
        const auto parsed = infrastructure::JsonMapping::ParseApplicant(json::parse(*content));
        if (!parsed) return 1;
        applicant = *parsed;
    }

    domain::EligibilityPolicy policy;
    if (const auto policyPath = FindArg(argc, argv, "--policy")) {
        const auto loaded = infrastructure::ConfigLoader::LoadPolicy(*policyPath);
        if (!loaded) return 1;
        policy = *loaded;
    } else {
        policy = infrastructure::ConfigLoader::ResolvePolicy(config);
    }

    domain::CalendarDate today = domain::CalendarDate::Today();
    if (const auto todayArg = FindArg(argc, argv, "--today")) {
        const auto parsed = domain::CalendarDate::ParseIso(*todayArg);
        if (!parsed) {
            std::cerr << "[DocVerify] --today must be YYYY-MM-DD, got: " << *todayArg << std::endl;
            return 1;
        }
        today = *parsed;
    }

    auto ocr = std::make_shared<infrastructure::TesseractCliAdapter>(config.tesseractPath, config.ocrLanguage);
    application::ExtractionOptions options;
    options.missingDate = config.missingDate;
    application::VerificationService service(ocr, policy, options);

    application::VerificationResult result;
    if (textPath) {
        const auto text = ReadTextFile(*textPath);
        if (!text) {
            std::cerr << "[DocVerify] Cannot read text file: " << *textPath << std::endl;
            return 1;
        }
        result = service.VerifyText(*text, applicant, policy, today);
    } else {
        std::ifstream file(*imagePath, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "[DocVerify] Cannot read image file: " << *imagePath << std::endl;
            return 1;
        }
        application::VerificationRequest request;
        request.imageBytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        request.applicant = applicant;
        request.policy = policy;
        result = service.Verify(request, today);
    }

    std::cout << infrastructure::JsonMapping::ToJson(result).dump(2) << std::endl;
    return 0;
}

int DocVerifyApp::RunMrz(int argc, char** argv) {
    const auto textPath = FindArg(argc, argv, "--text");
    if (!textPath) {
        PrintUsage();
        return 1;
    }
    const auto text = ReadTextFile(*textPath);
    if (!text) {
        std::cerr << "[DocVerify] Cannot read text file: " << *textPath << std::endl;
        return 1;
    }

    const auto record = domain::mrz::MrzCodec::ParseAndValidate(*text);
    std::cout << infrastructure::JsonMapping::ToJson(record).dump(2) << std::endl;
    return 0;
}

int DocVerifyApp::RunServe(int argc, char** argv) {
    auto config = LoadConfig(argc, argv);
    if (const auto port = FindArg(argc, argv, "--port")) {
        config.serverPort = std::stoi(*port);
    }

    if (!infrastructure::TesseractCliAdapter::HasTool(config.tesseractPath)) {
        std::cerr << "[DocVerify] Warning: " << config.tesseractPath
                  << " not found, every image request will fail" << std::endl;
    }

    auto ocr = std::make_shared<infrastructure::TesseractCliAdapter>(config.tesseractPath, config.ocrLanguage);
    application::ExtractionOptions options;
    options.missingDate = config.missingDate;
    auto service = std::make_shared<application::VerificationService>(
        ocr, infrastructure::ConfigLoader::ResolvePolicy(config), options);

    infrastructure::VerifyHttpServer server(service);
    return server.Listen(config.serverHost, config.serverPort) ? 0 : 1;
}

} // namespace docverify::app
