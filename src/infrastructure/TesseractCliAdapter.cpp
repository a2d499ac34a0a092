#include "infrastructure/TesseractCliAdapter.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>
#include <unistd.h>

namespace docverify::infrastructure {

namespace {

std::string Quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

bool HasText(const std::string& content) {
    for (char c : content) {
        if (!std::isspace(static_cast<unsigned char>(c))) return true;
    }
    return false;
}

} // namespace

TesseractCliAdapter::TesseractCliAdapter(const std::string& tesseractPath, const std::string& language)
    : m_tesseractPath(tesseractPath)
    , m_language(language)
{}

bool TesseractCliAdapter::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + Quote(tool) + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string TesseractCliAdapter::MakeTempFilePath() {
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "docverify_" + std::to_string(::getpid()) + "_" + std::to_string(now) + "_" +
                       std::to_string(m_counter++) + ".img";
    return (std::filesystem::temp_directory_path() / name).string();
}

std::string TesseractCliAdapter::RunCommand(const std::string& cmd, int& exitCode) {
    std::string output;
    exitCode = -1;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output.append(buffer);
    }
    exitCode = pclose(pipe);
    return output;
}

domain::OcrEngine::RecognitionResult TesseractCliAdapter::recognize(const std::vector<unsigned char>& imageBytes) {
    RecognitionResult result;
    result.method = "tesseract-cli";

    if (imageBytes.empty()) {
        result.warnings.push_back("Empty image data.");
        return result;
    }
    if (!HasTool(m_tesseractPath)) {
        std::cerr << "[TesseractCliAdapter] Tool not found: " << m_tesseractPath << std::endl;
        result.warnings.push_back("tesseract not found: " + m_tesseractPath);
        return result;
    }

    const std::string imagePath = MakeTempFilePath();
    {
        std::ofstream out(imagePath, std::ios::binary);
        if (!out.is_open()) {
            result.warnings.push_back("Could not create temporary file: " + imagePath);
            return result;
        }
        std::copy(imageBytes.begin(), imageBytes.end(), std::ostreambuf_iterator<char>(out));
    }

    std::stringstream cmd;
    cmd << Quote(m_tesseractPath) << " " << Quote(imagePath) << " stdout -l " << Quote(m_language) << " 2>/dev/null";
    std::cout << "[TesseractCliAdapter] Running: " << cmd.str() << std::endl;

    int exitCode = 0;
    std::string text = RunCommand(cmd.str(), exitCode);

    std::error_code ec;
    std::filesystem::remove(imagePath, ec);
    if (ec) {
        std::cerr << "[TesseractCliAdapter] Failed to remove " << imagePath << ": " << ec.message() << std::endl;
    }

    if (exitCode != 0) {
        result.warnings.push_back("tesseract exited with code: " + std::to_string(exitCode));
        return result;
    }
    if (!HasText(text)) {
        result.warnings.push_back("tesseract produced no text.");
        return result;
    }

    result.text = std::move(text);
    result.success = true;
    return result;
}

} // namespace docverify::infrastructure
