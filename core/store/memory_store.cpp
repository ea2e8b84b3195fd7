#include "store/memory_store.hpp"
#include "store/key_path.hpp"

namespace profprune {

MemoryStore::Node* MemoryStore::find(const std::string& path) {
    Node* node = &root_;
    for (const auto& component : KeyPath::split(path)) {
        auto it = node->children.find(component);
        if (it == node->children.end()) return nullptr;
        node = &it->second;
    }
    return node;
}

const MemoryStore::Node* MemoryStore::find(const std::string& path) const {
    const Node* node = &root_;
    for (const auto& component : KeyPath::split(path)) {
        auto it = node->children.find(component);
        if (it == node->children.end()) return nullptr;
        node = &it->second;
    }
    return node;
}

std::vector<std::string> MemoryStore::listChildren(const std::string& path) const {
    const Node* node = find(path);
    if (!node) {
        throw StoreError(StoreErrorKind::NotFound, path);
    }
    std::vector<std::string> names;
    names.reserve(node->children.size());
    for (const auto& [name, _] : node->children) {
        names.push_back(name);
    }
    return names;
}

PropertyBag MemoryStore::readProperties(const std::string& path) const {
    const Node* node = find(path);
    if (!node) {
        throw StoreError(StoreErrorKind::NotFound, path);
    }
    return node->values;
}

void MemoryStore::deleteRecursive(const std::string& path) {
    delete_calls_.push_back(path);

    std::string normalized = KeyPath::normalize(path);
    if (normalized.empty()) {
        throw StoreError(StoreErrorKind::AccessDenied, path, "cannot delete the root key");
    }
    if (denied_.count(normalized)) {
        throw StoreError(StoreErrorKind::AccessDenied, path);
    }

    Node* parent = find(KeyPath::parent(normalized));
    if (!parent) {
        throw StoreError(StoreErrorKind::NotFound, path);
    }
    if (parent->children.erase(KeyPath::leaf(normalized)) == 0) {
        throw StoreError(StoreErrorKind::NotFound, path);
    }
}

bool MemoryStore::exists(const std::string& path) const {
    return find(path) != nullptr;
}

bool MemoryStore::createKey(const std::string& path) {
    Node* node = &root_;
    bool created = false;
    for (const auto& component : KeyPath::split(path)) {
        auto [it, inserted] = node->children.try_emplace(component);
        created = inserted;
        node = &it->second;
    }
    return created;
}

void MemoryStore::setValue(const std::string& path, const std::string& name,
                           const std::string& data) {
    createKey(path);
    find(path)->values[name] = data;
}

void MemoryStore::denyDelete(const std::string& path) {
    denied_.insert(KeyPath::normalize(path));
}

size_t MemoryStore::keyCount() const {
    return countKeys(root_) - 1;  // root is not a key
}

size_t MemoryStore::countKeys(const Node& node) {
    size_t total = 1;
    for (const auto& [_, child] : node.children) {
        total += countKeys(child);
    }
    return total;
}

} // namespace profprune
