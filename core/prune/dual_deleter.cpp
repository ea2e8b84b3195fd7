#include "prune/dual_deleter.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace profprune {

DeletionOutcome DualDeleter::remove(const ProfileEntry& entry) {
    DeletionOutcome outcome;
    outcome.entry = entry;

    spdlog::info("Removing {} ({})", entry.identity, entry.location);
    try {
        store_.deleteRecursive(entry.location);

        if (entry.hasCorrelationId()) {
            // Checked now rather than at detection time.
            if (!ProfileRepository::isValidCorrelationId(entry.correlation_id)) {
                spdlog::warn("Ignoring malformed correlation id '{}' of {}",
                             entry.correlation_id, entry.identity);
            } else if (repository_.secondaryExists(entry.correlation_id)) {
                std::string secondary = repository_.secondaryPath(entry.correlation_id);
                spdlog::info("Removing correlated record {}", secondary);
                store_.deleteRecursive(secondary);
                outcome.secondary_removed = true;
            } else {
                spdlog::debug("No correlated record for {}", entry.correlation_id);
            }
        }
        outcome.removed = true;
    } catch (const std::exception& e) {
        outcome.cause = e.what();
        spdlog::warn("Failed to remove {} (correlation id '{}'): {}",
                     entry.location, entry.correlation_id, outcome.cause);
    }
    return outcome;
}

std::vector<DeletionOutcome> DualDeleter::removeAll(const std::vector<ProfileEntry>& entries) {
    std::vector<DeletionOutcome> outcomes;
    outcomes.reserve(entries.size());
    for (const auto& entry : entries) {
        outcomes.push_back(remove(entry));
    }
    return outcomes;
}

} // namespace profprune
