/**
 * @file DocVerifyApp.hpp
 * @brief Command line front end for DocVerify.
 */

#pragma once

#include <optional>
#include <string>

#include "infrastructure/ConfigLoader.hpp"

namespace docverify::app {

/**
 * @class DocVerifyApp
 * @brief Dispatches the `verify`, `mrz` and `serve` subcommands.
 */
class DocVerifyApp {
public:
    /**
     * @brief Runs one subcommand.
     * @return Exit code (0 for success, 1 for usage or runtime errors).
     */
    int Run(int argc, char** argv);

private:
    int RunVerify(int argc, char** argv);
    int RunMrz(int argc, char** argv);
    int RunServe(int argc, char** argv);
    void PrintUsage() const;

    /** @brief Loads --config (default ./settings.json). */
    infrastructure::AppConfig LoadConfig(int argc, char** argv) const;

    static std::optional<std::string> FindArg(int argc, char** argv, const std::string& key);
    static std::optional<std::string> ReadTextFile(const std::string& path);
};

} // namespace docverify::app
