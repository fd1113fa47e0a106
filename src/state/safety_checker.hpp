#pragma once
#include "optimization_state.hpp"
#include <string>
#include <vector>

namespace tollgate {

class StateTracker; // forward declaration

struct CheckResult {
    bool passed = true;
    std::vector<std::string> errors;
};

// Pre-change validation of the operations a task proposes.
class SafetyChecker {
public:
    // Check names as stored in the task state.
    static constexpr const char* OWNERSHIP = "ownership";
    static constexpr const char* LICENSE_COMPLIANCE = "license_compliance";
    static constexpr const char* BRANCH_PROTECTION = "branch_protection";

    // All checks; passed only if every check passed. Errors are
    // concatenated in check order.
    CheckResult preflight_check(const std::vector<Operation>& operations) const;

    // Every operation targets a non-empty path.
    CheckResult check_ownership(const std::vector<Operation>& operations) const;

    // No proposed content mentions "proprietary" (any case).
    CheckResult check_license_compliance(const std::vector<Operation>& operations) const;

    // Nothing under .git/ is touched.
    CheckResult check_branch_protection(const std::vector<Operation>& operations) const;

    // Run each check and store its outcome on the task. Returns false if
    // any outcome could not be recorded.
    bool record_checks(StateTracker& tracker, const std::string& task_id,
                       const std::vector<Operation>& operations) const;
};

} // namespace tollgate
