/**
 * @file TesseractCliAdapter.hpp
 * @brief OcrEngine backed by the tesseract command line tool.
 */

#pragma once

#include "domain/OcrEngine.hpp"

#include <atomic>
#include <string>

namespace docverify::infrastructure {

/**
 * @class TesseractCliAdapter
 * @brief Writes the image to a temporary file and reads `tesseract <file> stdout` back.
 *
 * Every call uses its own temporary file, so one instance can serve concurrent requests.
 */
class TesseractCliAdapter : public domain::OcrEngine {
public:
    TesseractCliAdapter(const std::string& tesseractPath, const std::string& language);
    ~TesseractCliAdapter() override = default;

    RecognitionResult recognize(const std::vector<unsigned char>& imageBytes) override;

    /** @brief True if @p tool resolves on the PATH (or is an executable path). */
    static bool HasTool(const std::string& tool);

private:
    std::string MakeTempFilePath();
    static std::string RunCommand(const std::string& cmd, int& exitCode);

    std::string m_tesseractPath;
    std::string m_language;
    std::atomic<unsigned long> m_counter{0};
};

} // namespace docverify::infrastructure
