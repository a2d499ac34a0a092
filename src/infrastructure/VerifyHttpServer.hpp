/**
 * @file VerifyHttpServer.hpp
 * @brief HTTP front end exposing POST /api/verify.
 */

#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "application/VerificationService.hpp"

namespace httplib {
class Server;
}

namespace docverify::infrastructure {

/**
 * @class VerifyHttpServer
 * @brief Thin adapter between cpp-httplib and VerificationService.
 */
class VerifyHttpServer {
public:
    /** @brief Status code plus JSON body of one handled request. */
    struct Response {
        int status = 200;
        nlohmann::json body;
    };

    explicit VerifyHttpServer(std::shared_ptr<application::VerificationService> service);
    ~VerifyHttpServer();

    /** @brief Blocks serving requests until Stop() is called or binding fails. */
    bool Listen(const std::string& host, int port);
    void Stop();

    /**
     * @brief Handles one /api/verify body. Does not touch the network.
     *
     * 400 for malformed JSON or missing image/applicant data, 500 when the pipeline fails.
     */
    Response HandleVerify(const std::string& requestBody) const;

private:
    std::shared_ptr<application::VerificationService> m_service;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace docverify::infrastructure
