#pragma once

#include "store/key_value_store.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace profprune {

// ─── Directory Store ───────────────────────────────────────────
// Store mirrored onto a directory tree:
//   key   → directory under root
//   value → regular file inside the key's directory, content = data
// Children enumerate sorted by name. A single trailing newline is
// stripped from value data.

class DirectoryStore : public KeyValueStore {
public:
    explicit DirectoryStore(std::filesystem::path root);

    std::vector<std::string> listChildren(const std::string& path) const override;
    PropertyBag readProperties(const std::string& path) const override;
    void deleteRecursive(const std::string& path) override;
    bool exists(const std::string& path) const override;

    /// Filesystem location of a key.
    std::filesystem::path resolve(const std::string& path) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;

    static StoreErrorKind classify(const std::error_code& ec);
};

} // namespace profprune
