#pragma once

#include "backup/command_runner.hpp"
#include "profile/profile_repository.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace profprune {

enum class Subtree {
    Secondary,  // exported first
    Primary
};

enum class BackupFailure {
    None,
    ToolNotFound,
    ExportFailed
};

const char* toString(Subtree subtree);
const char* toString(BackupFailure failure);

/// Backup tool and export file settings.
struct BackupConfig {
    std::string tool = "tar";
    // "{key}" → subtree store path, "{file}" → export file path
    std::vector<std::string> export_args = {"-cf", "{file}", "{key}"};
    std::string destination_dir;        // empty → system temp directory
    std::string file_prefix = "profprune";
    std::string file_extension = "tar";
    std::string primary_id = "ProfileList";
    std::string secondary_id = "ProfileGuid";
};

/// Result of the backup phase. On success `files` holds both exports,
/// secondary first.
struct BackupResult {
    bool success = false;
    BackupFailure failure = BackupFailure::None;
    Subtree failed_subtree = Subtree::Secondary;
    std::vector<std::string> files;
    int exit_code = 0;
    std::string tool_output;
    std::string message;
};

/// Thrown when the backup phase fails; no record has been touched.
class BackupError : public std::runtime_error {
public:
    explicit BackupError(const BackupResult& result)
        : std::runtime_error(result.message), result_(result) {}

    BackupFailure failure() const { return result_.failure; }
    Subtree subtree() const { return result_.failed_subtree; }
    const BackupResult& result() const { return result_; }

private:
    BackupResult result_;
};

// ─── Backup Gate ───────────────────────────────────────────────
// Exports the secondary subtree, then the primary subtree, each to its
// own timestamped file. The first failing step ends the phase; a failed
// secondary export means the primary export is never attempted.

class BackupGate {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    BackupGate(CommandRunner& runner, RepositoryConfig repository, BackupConfig config = {});

    /// Run both exports. Never throws for tool failures; inspect the result.
    BackupResult ensureBackup();

    /// Export file path for a subtree at the given time.
    std::string exportPath(Subtree subtree, std::chrono::system_clock::time_point when) const;

    /// Minute-granularity stamp, YYYYMMDD-HHMM in local time.
    static std::string timestamp(std::chrono::system_clock::time_point when);

    /// Replace the clock used for file names.
    void setClock(Clock clock) { clock_ = std::move(clock); }

    const BackupConfig& config() const { return config_; }

private:
    CommandRunner& runner_;
    RepositoryConfig repository_;
    BackupConfig config_;
    Clock clock_;

    std::string destinationDir() const;
    std::vector<std::string> buildArgs(const std::string& key, const std::string& file) const;
    bool exportSubtree(Subtree subtree, std::chrono::system_clock::time_point when,
                       BackupResult& result);
};

} // namespace profprune
