// profprune: audit and prune duplicate profile registrations.
//
//   profprune --prefix S-1-5-21-1111-2222-3333 --store-root /srv/registry
//
// Exit status: 0 on success (per-entry deletion failures included),
// 1 on a failed backup or store error, 2 on a usage error.

#include "backup/process_runner.hpp"
#include "prune/profile_pruner.hpp"
#include "store/directory_store.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>

using namespace profprune;

namespace {

constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

} // namespace

int main(int argc, char** argv) {
    PruneConfig config;

    cxxopts::Options options("profprune",
        "Remove duplicate profile registrations that point at the same profile directory");
    options.add_options()
        ("p,prefix", "Desired identity domain prefix (entries under it are kept)",
            cxxopts::value<std::string>())
        ("store-root", "Root directory of the configuration store",
            cxxopts::value<std::string>()->default_value("."))
        ("primary", "Store path of the primary profile list",
            cxxopts::value<std::string>()->default_value(config.repository.primary_root))
        ("secondary", "Store path of the correlated secondary list",
            cxxopts::value<std::string>()->default_value(config.repository.secondary_root))
        ("backup-dir", "Directory for the pre-deletion exports (default: temp dir)",
            cxxopts::value<std::string>())
        ("backup-tool", "Export executable",
            cxxopts::value<std::string>()->default_value(config.backup.tool))
        ("standard-prefix", "Domain-class prefix of standard user identities",
            cxxopts::value<std::string>()->default_value(config.identity.standard_prefix))
        ("n,dry-run", "List removal candidates without backing up or deleting")
        ("v,verbose", "Debug-level diagnostics")
        ("h,help", "Print usage");
    options.parse_positional({"prefix"});
    options.positional_help("<prefix>");

    std::string store_root;
    try {
        auto args = options.parse(argc, argv);
        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (!args.count("prefix") || args["prefix"].as<std::string>().empty()) {
            std::cerr << "profprune: --prefix is required" << std::endl
                      << options.help() << std::endl;
            return EXIT_USAGE;
        }

        config.desired_prefix = args["prefix"].as<std::string>();
        config.dry_run = args.count("dry-run") > 0;
        config.identity.standard_prefix = args["standard-prefix"].as<std::string>();
        config.repository.primary_root = args["primary"].as<std::string>();
        config.repository.secondary_root = args["secondary"].as<std::string>();
        config.backup.tool = args["backup-tool"].as<std::string>();
        if (args.count("backup-dir")) {
            config.backup.destination_dir = args["backup-dir"].as<std::string>();
        }
        store_root = args["store-root"].as<std::string>();

        spdlog::set_level(args.count("verbose") ? spdlog::level::debug : spdlog::level::info);
    } catch (const std::exception& e) {
        std::cerr << "profprune: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    // Store keys are paths relative to the store root.
    config.backup.export_args = {"-cf", "{file}", "-C", store_root, "{key}"};

    DirectoryStore store(store_root);
    ProcessRunner runner;

    try {
        ProfilePruner pruner(store, runner, config);
        PruneReport report = pruner.run();
        if (report.dry_run && !report.candidates.empty()) {
            spdlog::info("Dry run: {} candidate(s) left in place", report.candidates.size());
        }
    } catch (const BackupError& e) {
        spdlog::error("Backup failed ({}), no profile entries were removed: {}",
                      toString(e.failure()), e.what());
        return EXIT_FATAL;
    } catch (const StoreError& e) {
        spdlog::error("Store error: {}", e.what());
        return EXIT_FATAL;
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return EXIT_USAGE;
    }
    return 0;
}
