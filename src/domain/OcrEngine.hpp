/**
 * @file OcrEngine.hpp
 * @brief Interface for image-to-text recognition.
 */

#pragma once

#include <string>
#include <vector>

namespace docverify::domain {

/**
 * @class OcrEngine
 * @brief Abstract interface for services that turn document image bytes into raw text.
 *
 * Only the recognized text is consumed downstream; per-character confidence and
 * language detection are not part of the contract.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    struct RecognitionResult {
        std::string text;
        bool success = false;
        std::string method;                 ///< e.g. "tesseract-cli".
        std::vector<std::string> warnings;
    };

    /**
     * @brief Recognizes the text on a document image. Blocks until text is available.
     * @param imageBytes Encoded image (PNG, JPEG, TIFF...).
     */
    virtual RecognitionResult recognize(const std::vector<unsigned char>& imageBytes) = 0;
};

} // namespace docverify::domain
