#pragma once

#include "profile/identity_matcher.hpp"
#include "profile/profile_entry.hpp"

#include <string>
#include <vector>

namespace profprune {

// ─── Duplicate Grouper ─────────────────────────────────────────
// Partitions standard user entries by image path and keeps the paths
// claimed by two or more entries. Paths compare case-insensitively.
// Groups and their members keep first-seen order.
//
// Entries whose identity is not a standard user identity (service
// accounts, ".bak" leftovers, ...) are skipped entirely, as are
// entries with no image path: an unset path is not a shared directory.

class DuplicateGrouper {
public:
    explicit DuplicateGrouper(const IdentityConfig& config = {})
        : standard_(IdentityMatcher::standardUser(config)) {}

    std::vector<DuplicateGroup> group(const std::vector<ProfileEntry>& entries) const;

    bool isStandard(const ProfileEntry& entry) const {
        return standard_.matches(entry.identity);
    }

    /// True if the entry takes part in grouping at all.
    bool isGroupable(const ProfileEntry& entry) const {
        return !entry.image_path.empty() && isStandard(entry);
    }

    /// Case-folded grouping key for an image path.
    static std::string pathKey(const std::string& image_path);

private:
    IdentityMatcher standard_;
};

} // namespace profprune
