#pragma once

#include "backup/backup_gate.hpp"
#include "profile/identity_matcher.hpp"
#include "profile/profile_repository.hpp"
#include "prune/dual_deleter.hpp"
#include "store/key_value_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace profprune {

/// Run settings.
struct PruneConfig {
    std::string desired_prefix;     // required
    bool dry_run = false;           // audit only: no backup, no deletion
    IdentityConfig identity;
    RepositoryConfig repository;
    BackupConfig backup;
};

/// Everything one run found and did.
struct PruneReport {
    std::vector<DuplicateGroup> groups;
    std::vector<ProfileEntry> candidates;
    std::optional<BackupResult> backup;   // set only if the gate ran
    std::vector<DeletionOutcome> outcomes;
    bool dry_run = false;

    size_t removedCount() const;
    size_t failedCount() const;
};

// ─── Profile Pruner ────────────────────────────────────────────
// The whole run, strictly in order:
//   load → group → filter → backup gate → dual delete
// An empty removal set stops before the gate. A failed gate throws
// BackupError before any record is touched.

class ProfilePruner {
public:
    /// Throws std::invalid_argument if config.desired_prefix is empty.
    ProfilePruner(KeyValueStore& store, CommandRunner& runner, PruneConfig config);

    PruneReport run();

    /// Detection only: groups and candidates, no mutation, no backup.
    PruneReport audit() const;

    const PruneConfig& config() const { return config_; }

private:
    KeyValueStore& store_;
    CommandRunner& runner_;
    PruneConfig config_;
};

} // namespace profprune
