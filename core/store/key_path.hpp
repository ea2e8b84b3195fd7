#pragma once

#include <string>
#include <vector>

namespace profprune {

/// Helpers for '/'-separated store paths. Empty components are dropped,
/// so "a//b/" and "/a/b" name the same key.
struct KeyPath {
    static constexpr char SEPARATOR = '/';

    static std::vector<std::string> split(const std::string& path);
    static std::string join(const std::vector<std::string>& components);

    /// Append one child key name to a parent path.
    static std::string child(const std::string& parent, const std::string& name);

    /// Parent of path; "" for a top-level key.
    static std::string parent(const std::string& path);

    /// Last component of path; "" for the root.
    static std::string leaf(const std::string& path);

    /// Canonical form: components joined without leading/trailing separators.
    static std::string normalize(const std::string& path);
};

} // namespace profprune
