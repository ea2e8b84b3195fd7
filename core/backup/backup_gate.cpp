#include "backup/backup_gate.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace profprune {

const char* toString(Subtree subtree) {
    switch (subtree) {
        case Subtree::Secondary: return "secondary";
        case Subtree::Primary:   return "primary";
    }
    return "unknown";
}

const char* toString(BackupFailure failure) {
    switch (failure) {
        case BackupFailure::None:         return "none";
        case BackupFailure::ToolNotFound: return "backup tool not found";
        case BackupFailure::ExportFailed: return "export failed";
    }
    return "unknown";
}

namespace {

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string trimmed(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : text.substr(0, end + 1);
}

} // namespace

BackupGate::BackupGate(CommandRunner& runner, RepositoryConfig repository, BackupConfig config)
    : runner_(runner),
      repository_(std::move(repository)),
      config_(std::move(config)),
      clock_([] { return std::chrono::system_clock::now(); }) {}

std::string BackupGate::timestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local {};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d-%H%M");
    return oss.str();
}

std::string BackupGate::destinationDir() const {
    if (!config_.destination_dir.empty()) return config_.destination_dir;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::string("/tmp") : tmp.string();
}

std::string BackupGate::exportPath(Subtree subtree,
                                   std::chrono::system_clock::time_point when) const {
    const std::string& id = (subtree == Subtree::Secondary) ? config_.secondary_id
                                                            : config_.primary_id;
    std::string name = config_.file_prefix + "_" + id + "_BEFORE_" + timestamp(when);
    if (!config_.file_extension.empty()) {
        name += "." + config_.file_extension;
    }
    return (std::filesystem::path(destinationDir()) / name).string();
}

std::vector<std::string> BackupGate::buildArgs(const std::string& key,
                                               const std::string& file) const {
    std::vector<std::string> args;
    args.reserve(config_.export_args.size());
    for (std::string arg : config_.export_args) {
        replaceAll(arg, "{key}", key);
        replaceAll(arg, "{file}", file);
        args.push_back(std::move(arg));
    }
    return args;
}

bool BackupGate::exportSubtree(Subtree subtree, std::chrono::system_clock::time_point when,
                               BackupResult& result) {
    const std::string& key = (subtree == Subtree::Secondary) ? repository_.secondary_root
                                                             : repository_.primary_root;
    std::string file = exportPath(subtree, when);

    spdlog::info("Exporting {} subtree {} to {}", toString(subtree), key, file);
    CommandResult run;
    try {
        run = runner_.run(config_.tool, buildArgs(key, file));
    } catch (const std::system_error& e) {
        run.stderr_text = e.what();
    }

    if (!run.succeeded()) {
        result.failure = BackupFailure::ExportFailed;
        result.failed_subtree = subtree;
        result.exit_code = run.exit_code;
        result.tool_output = trimmed(run.stderr_text.empty() ? run.stdout_text : run.stderr_text);
        result.message = std::string("Backup of ") + toString(subtree) + " subtree " + key +
                         " failed with exit code " + std::to_string(run.exit_code);
        if (!result.tool_output.empty()) {
            result.message += ": " + result.tool_output;
        }
        return false;
    }

    result.files.push_back(file);
    return true;
}

BackupResult BackupGate::ensureBackup() {
    BackupResult result;

    if (!runner_.locate(config_.tool)) {
        result.failure = BackupFailure::ToolNotFound;
        result.message = "Backup tool not found: " + config_.tool;
        spdlog::error("{}", result.message);
        return result;
    }

    auto when = clock_();
    for (Subtree subtree : {Subtree::Secondary, Subtree::Primary}) {
        if (!exportSubtree(subtree, when, result)) {
            spdlog::error("{}", result.message);
            return result;
        }
    }

    result.success = true;
    result.message = "Backup completed";
    spdlog::info("Backup completed: {} files written", result.files.size());
    return result;
}

} // namespace profprune
