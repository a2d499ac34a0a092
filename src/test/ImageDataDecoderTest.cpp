#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "infrastructure/ImageDataDecoder.hpp"

using docverify::infrastructure::ImageDataDecoder;

namespace {

std::string AsString(const std::vector<unsigned char>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

int main() {
    std::cout << "[Test] Starting Image Data Decoder Test..." << std::endl;

    // Bare payloads
    auto bytes = ImageDataDecoder::Decode("aGVsbG8=");
    assert(bytes && AsString(*bytes) == "hello");
    bytes = ImageDataDecoder::Decode("aGVsbG8gd29ybGQ=");
    assert(bytes && AsString(*bytes) == "hello world");
    bytes = ImageDataDecoder::Decode("YWJj");
    assert(bytes && AsString(*bytes) == "abc");
    bytes = ImageDataDecoder::Decode("YQ==");
    assert(bytes && AsString(*bytes) == "a");

    // Binary content survives, including bytes above 0x7f.
    bytes = ImageDataDecoder::Decode("iVBORw0KGgo=");
    assert(bytes);
    const std::vector<unsigned char> pngSignature = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a};
    assert(*bytes == pngSignature);

    // Data URLs and wrapped payloads
    bytes = ImageDataDecoder::Decode("data:image/png;base64,aGVsbG8=");
    assert(bytes && AsString(*bytes) == "hello");
    bytes = ImageDataDecoder::Decode("aGVs\nbG8g\r\nd29y bGQ=");
    assert(bytes && AsString(*bytes) == "hello world");

    // A longer payload is read completely.
    std::string longText(3000, 'x');
    std::string longPayload;
    for (int i = 0; i < 1000; ++i) longPayload += "eHh4";
    bytes = ImageDataDecoder::Decode(longPayload);
    assert(bytes && AsString(*bytes) == longText);

    assert(ImageDataDecoder::StripDataUrlPrefix("data:image/jpeg;base64,QUJD") == "QUJD");
    assert(ImageDataDecoder::StripDataUrlPrefix("QUJD") == "QUJD");
    assert(ImageDataDecoder::StripDataUrlPrefix("data:image/jpeg").empty());

    // Rejected input
    assert(!ImageDataDecoder::Decode(""));
    assert(!ImageDataDecoder::Decode("   "));
    assert(!ImageDataDecoder::Decode("not base64!"));
    assert(!ImageDataDecoder::Decode("aGVsbG8"));
    assert(!ImageDataDecoder::Decode("aG=sbG8="));
    assert(!ImageDataDecoder::Decode("YQ==="));
    assert(!ImageDataDecoder::Decode("data:image/png;base64,"));
    assert(!ImageDataDecoder::Decode("data:image/png"));

    std::cout << "[PASS] Image Data Decoder Test." << std::endl;
    return 0;
}
