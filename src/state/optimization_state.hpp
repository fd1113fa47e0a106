#pragma once
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tollgate {

// One proposed change to one addressable resource.
struct Diff {
    std::string path;
    std::string original;
    std::string proposed;
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const Diff& other) const {
        return path == other.path && original == other.original &&
               proposed == other.proposed && metadata == other.metadata;
    }
    bool operator!=(const Diff& other) const { return !(*this == other); }
};

// A change a tool wants to make: write content to path.
struct Operation {
    std::string path;
    std::string content;
    std::string tool_name;
};

struct OptimizationState {
    std::string task_id;
    bool dry_run = true;
    std::vector<Diff> diffs;
    std::map<std::string, bool> safety_checks;

    // True when at least one check ran and none failed.
    bool all_checks_passed() const {
        if (safety_checks.empty()) return false;
        for (const auto& [name, passed] : safety_checks) {
            if (!passed) return false;
        }
        return true;
    }
};

inline nlohmann::json diff_to_json(const Diff& diff) {
    return {
        {"path", diff.path},
        {"original", diff.original},
        {"proposed", diff.proposed},
        {"metadata", diff.metadata}
    };
}

// nullopt when a required string field is missing or mistyped.
inline std::optional<Diff> diff_from_json(const nlohmann::json& item) {
    if (!item.is_object()) return std::nullopt;
    for (const char* field : {"path", "original", "proposed"}) {
        if (!item.contains(field) || !item[field].is_string()) return std::nullopt;
    }
    Diff diff;
    diff.path = item["path"].get<std::string>();
    diff.original = item["original"].get<std::string>();
    diff.proposed = item["proposed"].get<std::string>();
    if (item.contains("metadata") && item["metadata"].is_object()) {
        diff.metadata = item["metadata"];
    }
    return diff;
}

inline nlohmann::json diffs_to_json(const std::vector<Diff>& diffs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : diffs) arr.push_back(diff_to_json(d));
    return arr;
}

} // namespace tollgate
