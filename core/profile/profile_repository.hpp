#pragma once

#include "profile/profile_entry.hpp"
#include "store/key_value_store.hpp"

#include <string>
#include <vector>

namespace profprune {

/// Where the two related subtrees live in the store, and which values
/// carry the entry attributes.
struct RepositoryConfig {
    std::string primary_root = "HKLM/SOFTWARE/Microsoft/Windows NT/CurrentVersion/ProfileList";
    std::string secondary_root = "HKLM/SOFTWARE/Microsoft/Windows NT/CurrentVersion/ProfileGuid";
    std::string image_path_value = "ProfileImagePath";
    std::string correlation_value = "Guid";
};

// ─── Profile Repository ────────────────────────────────────────
// Read-only view over the primary list (keyed by identity) and the
// secondary list (keyed by correlation id).

class ProfileRepository {
public:
    ProfileRepository(const KeyValueStore& store, RepositoryConfig config = {});

    /// Snapshot every primary record in enumeration order.
    /// Throws StoreError if the primary root is missing.
    std::vector<ProfileEntry> loadEntries() const;

    /// Store path of the secondary record for a correlation id.
    std::string secondaryPath(const std::string& correlation_id) const;

    /// A correlation id names exactly one direct child of the secondary
    /// root. Empty ids, ids containing '/' and "." or ".." are rejected.
    static bool isValidCorrelationId(const std::string& correlation_id);

    /// True if a secondary record currently exists for the id.
    /// An invalid id never exists.
    bool secondaryExists(const std::string& correlation_id) const;

    const RepositoryConfig& config() const { return config_; }

private:
    const KeyValueStore& store_;
    RepositoryConfig config_;
};

} // namespace profprune
