#pragma once

#include "profile/profile_entry.hpp"
#include "profile/profile_repository.hpp"
#include "store/key_value_store.hpp"

#include <string>
#include <vector>

namespace profprune {

/// What happened to one entry in the delete phase.
struct DeletionOutcome {
    ProfileEntry entry;
    bool removed = false;            // primary (and any secondary) step succeeded
    bool secondary_removed = false;
    std::string cause;               // failure reason when !removed
};

// ─── Dual Deleter ──────────────────────────────────────────────
// For each entry: delete the primary record, then the secondary record
// named by its correlation id if that record exists right now. A failure
// is recorded against its entry and the batch moves on. Nothing is
// retried or rolled back.

class DualDeleter {
public:
    DualDeleter(KeyValueStore& store, const ProfileRepository& repository)
        : store_(store), repository_(repository) {}

    DeletionOutcome remove(const ProfileEntry& entry);

    /// Outcomes in input order.
    std::vector<DeletionOutcome> removeAll(const std::vector<ProfileEntry>& entries);

private:
    KeyValueStore& store_;
    const ProfileRepository& repository_;
};

} // namespace profprune
