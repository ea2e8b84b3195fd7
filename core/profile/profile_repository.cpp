#include "profile/profile_repository.hpp"
#include "store/key_path.hpp"

#include <spdlog/spdlog.h>

namespace profprune {

ProfileRepository::ProfileRepository(const KeyValueStore& store, RepositoryConfig config)
    : store_(store), config_(std::move(config)) {}

std::vector<ProfileEntry> ProfileRepository::loadEntries() const {
    std::vector<ProfileEntry> entries;

    for (const auto& name : store_.listChildren(config_.primary_root)) {
        ProfileEntry entry;
        entry.identity = name;
        entry.location = KeyPath::child(config_.primary_root, name);

        PropertyBag props = store_.readProperties(entry.location);
        auto path_it = props.find(config_.image_path_value);
        if (path_it != props.end()) entry.image_path = path_it->second;
        auto corr_it = props.find(config_.correlation_value);
        if (corr_it != props.end()) entry.correlation_id = corr_it->second;

        entries.push_back(std::move(entry));
    }

    spdlog::debug("Loaded {} profile entries from {}", entries.size(), config_.primary_root);
    return entries;
}

std::string ProfileRepository::secondaryPath(const std::string& correlation_id) const {
    return KeyPath::child(config_.secondary_root, correlation_id);
}

bool ProfileRepository::isValidCorrelationId(const std::string& correlation_id) {
    if (correlation_id == "." || correlation_id == "..") return false;
    std::vector<std::string> parts = KeyPath::split(correlation_id);
    return parts.size() == 1 && parts[0] == correlation_id;
}

bool ProfileRepository::secondaryExists(const std::string& correlation_id) const {
    if (!isValidCorrelationId(correlation_id)) return false;
    return store_.exists(secondaryPath(correlation_id));
}

} // namespace profprune
