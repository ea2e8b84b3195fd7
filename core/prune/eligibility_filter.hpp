#pragma once

#include "profile/identity_matcher.hpp"
#include "profile/profile_entry.hpp"

#include <string>
#include <vector>

namespace profprune {

// ─── Eligibility Filter ────────────────────────────────────────
// Decides which duplicate-group members may be removed. A member is
// protected only if its identity is <desired_prefix>-<digits>[-<digits>...].
// An identity equal to the bare prefix is not protected.

class EligibilityFilter {
public:
    /// Throws std::invalid_argument if desired_prefix is empty.
    explicit EligibilityFilter(const std::string& desired_prefix)
        : policy_(desired_prefix) {}

    /// True if the entry is protected from removal.
    bool isProtected(const ProfileEntry& entry) const {
        return policy_.matches(entry.identity);
    }

    /// Flattened removal set over all groups, group order then member order.
    std::vector<ProfileEntry> selectRemovable(const std::vector<DuplicateGroup>& groups) const;

    const std::string& desiredPrefix() const { return policy_.prefix(); }

private:
    IdentityMatcher policy_;
};

} // namespace profprune
