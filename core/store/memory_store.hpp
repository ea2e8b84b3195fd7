#pragma once

#include "store/key_value_store.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace profprune {

// ─── Memory Store ──────────────────────────────────────────────
// In-process hierarchical store. Children enumerate in name order, the way
// a registry lists sub-keys. Used for tests and for embedding the pruner
// over data loaded from elsewhere.

class MemoryStore : public KeyValueStore {
public:
    MemoryStore() = default;

    std::vector<std::string> listChildren(const std::string& path) const override;
    PropertyBag readProperties(const std::string& path) const override;
    void deleteRecursive(const std::string& path) override;
    bool exists(const std::string& path) const override;

    /// Create a key (and any missing parents). Returns false if it already existed.
    bool createKey(const std::string& path);

    /// Set a value on a key, creating the key if needed.
    void setValue(const std::string& path, const std::string& name, const std::string& data);

    /// Make deleteRecursive() on this exact path fail with AccessDenied.
    void denyDelete(const std::string& path);

    /// Every path passed to deleteRecursive(), in call order, including
    /// calls that failed.
    const std::vector<std::string>& deleteCalls() const { return delete_calls_; }

    size_t keyCount() const;

private:
    struct Node {
        PropertyBag values;
        std::map<std::string, Node> children;
    };

    Node root_;
    std::set<std::string> denied_;
    std::vector<std::string> delete_calls_;

    Node* find(const std::string& path);
    const Node* find(const std::string& path) const;
    static size_t countKeys(const Node& node);
};

} // namespace profprune
