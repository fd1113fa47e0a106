#pragma once
#include "optimization_state.hpp"
#include "../config.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tollgate {

class KvStore;  // forward declaration
class Clock;    // forward declaration
class EventBus; // forward declaration

// Durable per-task record of proposed diffs and safety-check outcomes.
//
// Each task is one hash under key_prefix + task_id:
//   task_id, dry_run ("1"/"0"), diffs (JSON array), check:<name> ("1"/"0")
// Diff and check updates touch a single field atomically and only when the
// record exists, so concurrent updaters of different fields do not lose
// each other's writes. Every write refreshes the retention TTL.
class StateTracker {
public:
    // shared may be null. When it is null or does not answer a ping, the
    // tracker runs on a private in-process store for its whole lifetime.
    StateTracker(const StateConfig& config, KvStore* shared, Clock& clock,
                 EventBus* bus = nullptr);
    ~StateTracker();

    // Fresh state with no diffs or checks, persisted (overwrites any
    // previous record for task_id) and returned. A failed write is logged;
    // call save_state to learn the outcome.
    OptimizationState create_state(const std::string& task_id, bool dry_run);

    // Replace the whole record. Returns false if the store write failed.
    bool save_state(const OptimizationState& state);

    // nullopt when absent, expired, unreadable or corrupt.
    std::optional<OptimizationState> get_state(const std::string& task_id);

    // Replace the task's diff list. False if the task does not exist.
    bool update_diffs(const std::string& task_id, const std::vector<Diff>& diffs);

    // Record one check outcome. False if the task does not exist.
    bool update_safety_check(const std::string& task_id, const std::string& check_name,
                             bool passed);

    // Pair the current content at operation.path (empty when missing,
    // unreadable or not UTF-8) with the proposed content.
    Diff generate_diff(const Operation& operation) const;

    // True when running on the private in-process store.
    bool using_fallback() const { return fallback_ != nullptr; }

    std::string record_key(const std::string& task_id) const {
        return config_.key_prefix + task_id;
    }

private:
    bool set_field(const std::string& task_id, const std::string& field,
                   const std::string& value);
    void saved(const std::string& task_id, const std::string& field);

    StateConfig config_;
    std::unique_ptr<KvStore> fallback_;
    KvStore* store_;
    EventBus* bus_;
};

} // namespace tollgate
