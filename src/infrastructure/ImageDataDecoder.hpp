/**
 * @file ImageDataDecoder.hpp
 * @brief Decodes the base64 image payloads accepted by the HTTP API.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docverify::infrastructure {

class ImageDataDecoder {
public:
    /**
     * @brief Decodes either a `data:<mime>;base64,<payload>` URL or a bare base64 payload.
     * @return The image bytes, or std::nullopt if the payload is empty or not base64.
     */
    static std::optional<std::vector<unsigned char>> Decode(const std::string& imageData);

    /** @brief Part after the first comma of a data URL; the input itself otherwise. */
    static std::string StripDataUrlPrefix(const std::string& imageData);
};

} // namespace docverify::infrastructure
