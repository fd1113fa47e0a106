#include "safety_checker.hpp"
#include "state_tracker.hpp"
#include "../util.hpp"

namespace tollgate {

static void merge_into(CheckResult& total, const CheckResult& part) {
    if (part.passed) return;
    total.passed = false;
    total.errors.insert(total.errors.end(), part.errors.begin(), part.errors.end());
}

CheckResult SafetyChecker::preflight_check(const std::vector<Operation>& operations) const {
    CheckResult result;
    merge_into(result, check_ownership(operations));
    merge_into(result, check_license_compliance(operations));
    merge_into(result, check_branch_protection(operations));
    return result;
}

CheckResult SafetyChecker::check_ownership(const std::vector<Operation>& operations) const {
    CheckResult result;
    for (const auto& op : operations) {
        if (op.path.empty()) {
            result.errors.push_back("Invalid path: empty target for tool " + op.tool_name);
        }
    }
    result.passed = result.errors.empty();
    return result;
}

CheckResult SafetyChecker::check_license_compliance(
        const std::vector<Operation>& operations) const {
    CheckResult result;
    for (const auto& op : operations) {
        if (to_lower(op.content).find("proprietary") != std::string::npos) {
            result.errors.push_back("Proprietary content detected in " + op.path);
        }
    }
    result.passed = result.errors.empty();
    return result;
}

CheckResult SafetyChecker::check_branch_protection(
        const std::vector<Operation>& operations) const {
    CheckResult result;
    for (const auto& op : operations) {
        if (op.path.compare(0, 5, ".git/") == 0) {
            result.errors.push_back("Modification of git files not allowed: " + op.path);
        }
    }
    result.passed = result.errors.empty();
    return result;
}

bool SafetyChecker::record_checks(StateTracker& tracker, const std::string& task_id,
                                  const std::vector<Operation>& operations) const {
    bool ok = true;
    ok = tracker.update_safety_check(task_id, OWNERSHIP,
                                     check_ownership(operations).passed) && ok;
    ok = tracker.update_safety_check(task_id, LICENSE_COMPLIANCE,
                                     check_license_compliance(operations).passed) && ok;
    ok = tracker.update_safety_check(task_id, BRANCH_PROTECTION,
                                     check_branch_protection(operations).passed) && ok;
    return ok;
}

} // namespace tollgate
