#pragma once

#include <string>
#include <vector>

namespace profprune {

// ─── Profile Entry ─────────────────────────────────────────────
// One primary profile registration record. The store owns the record;
// this is a read snapshot taken during a run.

struct ProfileEntry {
    std::string identity;        // key name, e.g. S-1-5-21-...-1001
    std::string image_path;      // on-disk profile directory
    std::string correlation_id;  // secondary record name, may be empty
    std::string location;        // full store path of the record

    bool hasCorrelationId() const { return !correlation_id.empty(); }

    bool operator==(const ProfileEntry& other) const {
        return identity == other.identity && image_path == other.image_path &&
               correlation_id == other.correlation_id && location == other.location;
    }
    bool operator!=(const ProfileEntry& other) const { return !(*this == other); }
};

// ─── Duplicate Group ───────────────────────────────────────────
// Two or more entries that share an image path. Only exists during
// the detection pass.

struct DuplicateGroup {
    std::string image_path;              // as spelled by the first member
    std::vector<ProfileEntry> members;   // enumeration order

    size_t size() const { return members.size(); }
};

} // namespace profprune
