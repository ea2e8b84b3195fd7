#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace profprune {

// ─── Property Bag ──────────────────────────────────────────────
// Named string values stored directly on a key.

using PropertyBag = std::map<std::string, std::string>;

// ─── Store Error ───────────────────────────────────────────────

enum class StoreErrorKind {
    NotFound,
    AccessDenied,
    Io
};

const char* toString(StoreErrorKind kind);

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorKind kind, const std::string& path, const std::string& detail = "");

    StoreErrorKind kind() const { return kind_; }
    const std::string& path() const { return path_; }

private:
    StoreErrorKind kind_;
    std::string path_;
};

// ─── Key-Value Store ───────────────────────────────────────────
// Hierarchical configuration store addressed by '/'-separated key paths.
// Keys hold named values and child keys.

class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /// Names of the direct child keys under path, in the store's natural
    /// enumeration order. Throws StoreError(NotFound) if path is absent.
    virtual std::vector<std::string> listChildren(const std::string& path) const = 0;

    /// Values stored on the key at path.
    virtual PropertyBag readProperties(const std::string& path) const = 0;

    /// Remove the key at path with all of its sub-keys and values.
    virtual void deleteRecursive(const std::string& path) = 0;

    virtual bool exists(const std::string& path) const = 0;
};

} // namespace profprune
