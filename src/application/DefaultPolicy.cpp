#include "application/DefaultPolicy.hpp"

#include <string>
#include <utility>
#include <vector>

namespace docverify::application {

domain::EligibilityPolicy DefaultEligibilityPolicy() {
    domain::EligibilityPolicy policy;
    policy.minAge = 18;
    policy.maxAge = 120;
    policy.blockedNationalities = {"PRK"};
    policy.requiredDocumentTypes = {"P", "I"};
    policy.minValidityMonths = 6;

    auto visaType = [](int minAge, std::vector<std::string> requirements) {
        domain::VisaTypeRequirement requirement;
        requirement.minAge = minAge;
        requirement.additionalRequirements = std::move(requirements);
        return requirement;
    };

    policy.visaTypeRequirements["tourist"] = visaType(18, {"Valid passport", "Proof of accommodation"});
    policy.visaTypeRequirements["business"] = visaType(21, {"Valid passport", "Business invitation letter"});
    policy.visaTypeRequirements["student"] = visaType(16, {"Valid passport", "Letter of acceptance from institution"});
    policy.visaTypeRequirements["work"] = visaType(18, {"Valid passport", "Job offer letter", "Work permit"});
    return policy;
}

} // namespace docverify::application
