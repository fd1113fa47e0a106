#include "state_tracker.hpp"
#include "../clock.hpp"
#include "../event_bus.hpp"
#include "../store.hpp"
#include "../store/memory_store.hpp"
#include "../util.hpp"
#include <filesystem>
#include <iostream>

namespace tollgate {

static const std::string CHECK_PREFIX = "check:";

static const char* flag(bool value) { return value ? "1" : "0"; }

// Invalid UTF-8 in caller-supplied content is replaced with U+FFFD rather
// than failing the write.
static std::string dump_diffs(const std::vector<Diff>& diffs) {
    return diffs_to_json(diffs).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static std::optional<bool> parse_flag(const std::string& text) {
    if (text == "1") return true;
    if (text == "0") return false;
    return std::nullopt;
}

StateTracker::StateTracker(const StateConfig& config, KvStore* shared, Clock& clock,
                           EventBus* bus)
    : config_(config), store_(shared), bus_(bus) {
    if (!store_ || !store_->ping()) {
        if (store_) {
            std::cerr << "[state] Shared store unreachable, keeping task state in memory"
                         " (not shared across processes)\n";
        }
        fallback_ = std::make_unique<InMemoryStore>(clock);
        store_ = fallback_.get();
    }
}

StateTracker::~StateTracker() = default;

void StateTracker::saved(const std::string& task_id, const std::string& field) {
    StateSavedEvent ev;
    ev.task_id = task_id;
    ev.field = field;
    publish_to(bus_, ev);
}

OptimizationState StateTracker::create_state(const std::string& task_id, bool dry_run) {
    OptimizationState state;
    state.task_id = task_id;
    state.dry_run = dry_run;
    if (!save_state(state)) {
        std::cerr << "[state] Task " << task_id
                  << " was not persisted; it will not be found later\n";
    }
    return state;
}

bool StateTracker::save_state(const OptimizationState& state) {
    FieldMap fields;
    fields["task_id"] = state.task_id;
    fields["dry_run"] = flag(state.dry_run);
    fields["diffs"] = dump_diffs(state.diffs);
    for (const auto& [name, passed] : state.safety_checks) {
        fields[CHECK_PREFIX + name] = flag(passed);
    }

    try {
        store_->hash_replace(record_key(state.task_id), fields, config_.retention);
    } catch (const StoreError& e) {
        std::cerr << "[state] Failed to save task " << state.task_id << ": " << e.what() << "\n";
        return false;
    }
    saved(state.task_id, "");
    return true;
}

std::optional<OptimizationState> StateTracker::get_state(const std::string& task_id) {
    FieldMap fields;
    try {
        fields = store_->hash_get_all(record_key(task_id));
    } catch (const StoreError& e) {
        std::cerr << "[state] Failed to read task " << task_id << ": " << e.what() << "\n";
        return std::nullopt;
    }
    if (fields.empty()) return std::nullopt;

    auto corrupt = [&](const std::string& why) -> std::optional<OptimizationState> {
        std::cerr << "[state] Corrupt record for task " << task_id << ": " << why << "\n";
        return std::nullopt;
    };

    auto id_it = fields.find("task_id");
    auto dry_it = fields.find("dry_run");
    if (id_it == fields.end()) return corrupt("missing task_id");
    if (dry_it == fields.end()) return corrupt("missing dry_run");
    auto dry_run = parse_flag(dry_it->second);
    if (!dry_run) return corrupt("bad dry_run value");

    OptimizationState state;
    state.task_id = id_it->second;
    state.dry_run = *dry_run;

    auto diffs_it = fields.find("diffs");
    if (diffs_it != fields.end()) {
        auto arr = nlohmann::json::parse(diffs_it->second, nullptr, false);
        if (arr.is_discarded() || !arr.is_array()) return corrupt("diffs is not a JSON array");
        for (const auto& item : arr) {
            auto diff = diff_from_json(item);
            if (!diff) return corrupt("malformed diff entry");
            state.diffs.push_back(std::move(*diff));
        }
    }

    for (const auto& [field, value] : fields) {
        if (field.compare(0, CHECK_PREFIX.size(), CHECK_PREFIX) != 0) continue;
        auto passed = parse_flag(value);
        if (!passed) return corrupt("bad value for " + field);
        state.safety_checks[field.substr(CHECK_PREFIX.size())] = *passed;
    }

    return state;
}

bool StateTracker::set_field(const std::string& task_id, const std::string& field,
                             const std::string& value) {
    bool found = false;
    try {
        found = store_->hash_set_if_exists(record_key(task_id), field, value,
                                           config_.retention);
    } catch (const StoreError& e) {
        std::cerr << "[state] Failed to update " << field << " of task " << task_id
                  << ": " << e.what() << "\n";
        return false;
    }
    if (!found) {
        std::cerr << "[state] State not found for task " << task_id << "\n";
        return false;
    }
    saved(task_id, field);
    return true;
}

bool StateTracker::update_diffs(const std::string& task_id, const std::vector<Diff>& diffs) {
    return set_field(task_id, "diffs", dump_diffs(diffs));
}

bool StateTracker::update_safety_check(const std::string& task_id,
                                       const std::string& check_name, bool passed) {
    return set_field(task_id, CHECK_PREFIX + check_name, flag(passed));
}

Diff StateTracker::generate_diff(const Operation& operation) const {
    Diff diff;
    diff.path = operation.path;
    diff.proposed = operation.content;
    diff.metadata = {{"tool", operation.tool_name}};

    std::error_code ec;
    if (!operation.path.empty() && std::filesystem::is_regular_file(operation.path, ec)) {
        try {
            std::string content = read_file(operation.path);
            if (is_valid_utf8(content)) {
                diff.original = std::move(content);
            } else {
                std::cerr << "[state] Original " << operation.path
                          << " is not valid UTF-8, treating it as empty\n";
            }
        } catch (const std::runtime_error& e) {
            std::cerr << "[state] Could not read original " << operation.path
                      << ": " << e.what() << "\n";
        }
    }
    return diff;
}

} // namespace tollgate
