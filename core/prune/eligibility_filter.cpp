#include "prune/eligibility_filter.hpp"

namespace profprune {

std::vector<ProfileEntry> EligibilityFilter::selectRemovable(
    const std::vector<DuplicateGroup>& groups) const {

    std::vector<ProfileEntry> removable;
    for (const auto& group : groups) {
        if (group.size() < 2) continue;
        for (const auto& member : group.members) {
            if (!isProtected(member)) {
                removable.push_back(member);
            }
        }
    }
    return removable;
}

} // namespace profprune
