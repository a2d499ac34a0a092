#include "infrastructure/VerifyHttpServer.hpp"

#include <httplib.h>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "infrastructure/ImageDataDecoder.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace docverify::infrastructure {

using json = nlohmann::json;

namespace {

VerifyHttpServer::Response Error(int status, const std::string& message) {
    return {status, json{{"error", message}}};
}

bool IsPresent(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) return false;
    if (body[key].is_string()) return !body[key].get<std::string>().empty();
    return true;
}

} // namespace

VerifyHttpServer::VerifyHttpServer(std::shared_ptr<application::VerificationService> service)
    : m_service(std::move(service))
    , m_server(std::make_unique<httplib::Server>())
{
    m_server->Post("/api/verify", [this](const httplib::Request& req, httplib::Response& res) {
        const Response response = HandleVerify(req.body);
        res.status = response.status;
        res.set_content(response.body.dump(), "application/json");
    });
}

VerifyHttpServer::~VerifyHttpServer() = default;

bool VerifyHttpServer::Listen(const std::string& host, int port) {
    std::cout << "[VerifyHttpServer] Listening on " << host << ":" << port << std::endl;
    const bool ok = m_server->listen(host, port);
    if (!ok) {
        std::cerr << "[VerifyHttpServer] Could not bind " << host << ":" << port << std::endl;
    }
    return ok;
}

void VerifyHttpServer::Stop() {
    m_server->stop();
}

VerifyHttpServer::Response VerifyHttpServer::HandleVerify(const std::string& requestBody) const {
    json body;
    try {
        body = json::parse(requestBody);
    } catch (const json::parse_error& e) {
        std::cerr << "[VerifyHttpServer] JSON Parse Error: " << e.what() << std::endl;
        return Error(400, "Invalid JSON body");
    }
    if (!body.is_object()) {
        return Error(400, "Invalid JSON body");
    }

    if (!IsPresent(body, "imageData")) {
        return Error(400, "Image data is required");
    }
    if (!IsPresent(body, "applicantData")) {
        return Error(400, "Applicant data is required");
    }
    if (!body["imageData"].is_string()) {
        return Error(400, "Image data must be a base64 string");
    }

    auto applicant = JsonMapping::ParseApplicant(body["applicantData"]);
    if (!applicant) {
        return Error(400, "Applicant data is invalid");
    }

    application::VerificationRequest request;
    request.applicant = std::move(*applicant);
    if (IsPresent(body, "eligibilityPolicy")) {
        auto policy = JsonMapping::ParsePolicy(body["eligibilityPolicy"], m_service->defaultPolicy());
        if (!policy) {
            return Error(400, "Eligibility policy is invalid");
        }
        request.policy = std::move(*policy);
    }

    try {
        auto bytes = ImageDataDecoder::Decode(body["imageData"].get<std::string>());
        if (!bytes) {
            throw std::runtime_error("Image data is not valid base64");
        }
        request.imageBytes = std::move(*bytes);

        const auto result = m_service->Verify(request);
        return {200, JsonMapping::ToJson(result)};
    } catch (const std::exception& e) {
        std::cerr << "[VerifyHttpServer] Verification error: " << e.what() << std::endl;
        return {500, json{{"error", "Verification failed"}, {"details", e.what()}}};
    }
}

} // namespace docverify::infrastructure
