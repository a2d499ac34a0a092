#include "infrastructure/ImageDataDecoder.hpp"

#include <cctype>

#include <openssl/bio.h>
#include <openssl/evp.h>

namespace docverify::infrastructure {

namespace {

bool IsBase64Char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

// Drops whitespace and rejects anything outside the base64 alphabet or misplaced padding.
std::optional<std::string> CleanPayload(const std::string& payload) {
    std::string clean;
    clean.reserve(payload.size());
    size_t padding = 0;
    for (unsigned char c : payload) {
        if (std::isspace(c)) continue;
        if (c == '=') {
            ++padding;
        } else if (!IsBase64Char(c) || padding > 0) {
            return std::nullopt;
        }
        clean.push_back(static_cast<char>(c));
    }
    if (clean.empty() || padding > 2 || clean.size() % 4 != 0) {
        return std::nullopt;
    }
    return clean;
}

} // namespace

std::string ImageDataDecoder::StripDataUrlPrefix(const std::string& imageData) {
    if (imageData.rfind("data:", 0) != 0) return imageData;
    const auto comma = imageData.find(',');
    return comma == std::string::npos ? std::string() : imageData.substr(comma + 1);
}

std::optional<std::vector<unsigned char>> ImageDataDecoder::Decode(const std::string& imageData) {
    const auto payload = CleanPayload(StripDataUrlPrefix(imageData));
    if (!payload) return std::nullopt;

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* source = BIO_new_mem_buf(payload->data(), static_cast<int>(payload->size()));
    if (!b64 || !source) {
        BIO_free(b64);
        BIO_free(source);
        return std::nullopt;
    }
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO* bio = BIO_push(b64, source);

    // The base64 filter hands out decoded data in chunks.
    std::vector<unsigned char> bytes(payload->size() / 4 * 3);
    size_t total = 0;
    while (total < bytes.size()) {
        const int read = BIO_read(bio, bytes.data() + total, static_cast<int>(bytes.size() - total));
        if (read <= 0) break;
        total += static_cast<size_t>(read);
    }
    BIO_free_all(bio);

    if (total == 0) return std::nullopt;
    bytes.resize(total);
    return bytes;
}

} // namespace docverify::infrastructure
