#include "prune/profile_pruner.hpp"
#include "prune/duplicate_grouper.hpp"
#include "prune/eligibility_filter.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace profprune {

size_t PruneReport::removedCount() const {
    size_t n = 0;
    for (const auto& o : outcomes) {
        if (o.removed) n++;
    }
    return n;
}

size_t PruneReport::failedCount() const {
    return outcomes.size() - removedCount();
}

ProfilePruner::ProfilePruner(KeyValueStore& store, CommandRunner& runner, PruneConfig config)
    : store_(store), runner_(runner), config_(std::move(config)) {
    if (config_.desired_prefix.empty()) {
        throw std::invalid_argument("Desired identity prefix must not be empty");
    }
}

PruneReport ProfilePruner::audit() const {
    PruneReport report;
    report.dry_run = true;

    ProfileRepository repository(store_, config_.repository);
    DuplicateGrouper grouper(config_.identity);
    EligibilityFilter filter(config_.desired_prefix);

    spdlog::info("Desired identity prefix: {}", filter.desiredPrefix());

    report.groups = grouper.group(repository.loadEntries());
    for (const auto& group : report.groups) {
        spdlog::debug("Duplicate image path {} ({} entries)", group.image_path, group.size());
        for (const auto& member : group.members) {
            spdlog::debug("  {}{}", member.identity,
                          filter.isProtected(member) ? " [kept]" : "");
        }
    }

    report.candidates = filter.selectRemovable(report.groups);
    spdlog::info("Found {} removal candidate(s) in {} duplicate group(s)",
                 report.candidates.size(), report.groups.size());
    return report;
}

PruneReport ProfilePruner::run() {
    PruneReport report = audit();
    report.dry_run = config_.dry_run;

    if (report.candidates.empty()) {
        spdlog::info("Nothing to remove");
        return report;
    }

    if (config_.dry_run) {
        for (const auto& entry : report.candidates) {
            spdlog::info("Would remove {} ({})", entry.identity, entry.location);
        }
        return report;
    }

    BackupGate gate(runner_, config_.repository, config_.backup);
    report.backup = gate.ensureBackup();
    if (!report.backup->success) {
        throw BackupError(*report.backup);
    }

    ProfileRepository repository(store_, config_.repository);
    DualDeleter deleter(store_, repository);
    report.outcomes = deleter.removeAll(report.candidates);

    spdlog::info("Removed {} of {} candidate(s)", report.removedCount(), report.candidates.size());
    if (report.failedCount() > 0) {
        spdlog::warn("{} candidate(s) could not be removed", report.failedCount());
    }
    return report;
}

} // namespace profprune
