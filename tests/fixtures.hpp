#pragma once

#include "backup/command_runner.hpp"
#include "profile/profile_repository.hpp"
#include "store/key_path.hpp"
#include "store/memory_store.hpp"

#include <string>
#include <vector>

namespace profprune {
namespace fixtures {

// Numeric machine/domain prefixes used throughout the tests.
inline const std::string DOMAIN_A = "S-1-5-21-1111-2222-3333";
inline const std::string DOMAIN_B = "S-1-5-21-4444-5555-6666";
inline const std::string DOMAIN_C = "S-1-5-21-7777-8888-9999";

inline ProfileEntry makeEntry(const std::string& identity, const std::string& image_path,
                              const std::string& correlation_id = "") {
    RepositoryConfig cfg;
    return {identity, image_path, correlation_id, KeyPath::child(cfg.primary_root, identity)};
}

/// Add a primary record (and, if secondary is set, its correlated record).
inline void addProfile(MemoryStore& store, const std::string& identity,
                       const std::string& image_path, const std::string& guid = "",
                       bool secondary = true, const RepositoryConfig& cfg = {}) {
    std::string key = KeyPath::child(cfg.primary_root, identity);
    store.setValue(key, cfg.image_path_value, image_path);
    store.setValue(key, "State", "0");
    if (!guid.empty()) {
        store.setValue(key, cfg.correlation_value, guid);
        if (secondary) {
            store.setValue(KeyPath::child(cfg.secondary_root, guid), "SidString", identity);
        }
    }
}

/// Scripted CommandRunner. Exit codes are consumed per run() call;
/// once exhausted every further call succeeds.
class FakeRunner : public CommandRunner {
public:
    struct Call {
        std::string program;
        std::vector<std::string> args;
    };

    bool tool_present = true;
    std::vector<int> exit_codes;
    std::string failure_output = "export failed";
    std::vector<Call> calls;

    std::optional<std::string> locate(const std::string& program) const override {
        if (!tool_present) return std::nullopt;
        return "/usr/bin/" + program;
    }

    CommandResult run(const std::string& program,
                      const std::vector<std::string>& args) override {
        size_t index = calls.size();
        calls.push_back({program, args});

        CommandResult result;
        result.exit_code = index < exit_codes.size() ? exit_codes[index] : 0;
        if (result.exit_code != 0) result.stderr_text = failure_output;
        return result;
    }
};

} // namespace fixtures
} // namespace profprune
