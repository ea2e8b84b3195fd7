#include "prune/duplicate_grouper.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace profprune {

std::string DuplicateGrouper::pathKey(const std::string& image_path) {
    std::string key = image_path;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

std::vector<DuplicateGroup> DuplicateGrouper::group(
    const std::vector<ProfileEntry>& entries) const {

    // path key → index into buckets, buckets in first-seen order
    std::unordered_map<std::string, size_t> index;
    std::vector<DuplicateGroup> buckets;

    for (const auto& entry : entries) {
        if (!isGroupable(entry)) continue;

        std::string key = pathKey(entry.image_path);
        auto it = index.find(key);
        if (it == index.end()) {
            index.emplace(key, buckets.size());
            buckets.push_back({entry.image_path, {entry}});
        } else {
            buckets[it->second].members.push_back(entry);
        }
    }

    std::vector<DuplicateGroup> groups;
    for (auto& bucket : buckets) {
        if (bucket.size() >= 2) {
            groups.push_back(std::move(bucket));
        }
    }
    return groups;
}

} // namespace profprune
