/**
 * @file CheckResult.hpp
 * @brief Verdict produced by a single validation or eligibility check.
 */

#pragma once

#include <string>
#include <utility>

namespace docverify::domain {

struct CheckResult {
    std::string check;    ///< Display name, e.g. "Document Expiry".
    bool passed = false;
    std::string message;

    static CheckResult Pass(std::string name, std::string msg) {
        return CheckResult{std::move(name), true, std::move(msg)};
    }
    static CheckResult Fail(std::string name, std::string msg) {
        return CheckResult{std::move(name), false, std::move(msg)};
    }
};

using ValidationCheck = CheckResult;
using EligibilityCheck = CheckResult;

} // namespace docverify::domain
