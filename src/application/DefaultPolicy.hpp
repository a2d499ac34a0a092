/**
 * @file DefaultPolicy.hpp
 * @brief Built-in eligibility policy used when the caller supplies none.
 */

#pragma once

#include "domain/EligibilityPolicy.hpp"

namespace docverify::application {

/**
 * @brief Ages 18-120, PRK blocked, passports and ID cards accepted, six months of validity,
 *        plus the tourist/business/student/work visa types.
 */
domain::EligibilityPolicy DefaultEligibilityPolicy();

} // namespace docverify::application
