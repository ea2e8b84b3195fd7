// PyBind11 bindings for the profprune core.
// Exposes the store, detection, backup and pruning APIs to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "store/key_value_store.hpp"
#include "store/memory_store.hpp"
#include "store/directory_store.hpp"
#include "profile/profile_entry.hpp"
#include "profile/identity_matcher.hpp"
#include "profile/profile_repository.hpp"
#include "prune/duplicate_grouper.hpp"
#include "prune/eligibility_filter.hpp"
#include "prune/dual_deleter.hpp"
#include "prune/profile_pruner.hpp"
#include "backup/command_runner.hpp"
#include "backup/process_runner.hpp"
#include "backup/backup_gate.hpp"

namespace py = pybind11;

PYBIND11_MODULE(profprune_bindings, m) {
    m.doc() = "profprune core bindings";

    py::register_exception<profprune::StoreError>(m, "StoreError", PyExc_RuntimeError);
    py::register_exception<profprune::BackupError>(m, "BackupError", PyExc_RuntimeError);

    // ── Stores ──
    py::class_<profprune::KeyValueStore>(m, "KeyValueStore")
        .def("list_children", &profprune::KeyValueStore::listChildren)
        .def("read_properties", &profprune::KeyValueStore::readProperties)
        .def("delete_recursive", &profprune::KeyValueStore::deleteRecursive)
        .def("exists", &profprune::KeyValueStore::exists);

    py::class_<profprune::MemoryStore, profprune::KeyValueStore>(m, "MemoryStore")
        .def(py::init<>())
        .def("create_key", &profprune::MemoryStore::createKey)
        .def("set_value", &profprune::MemoryStore::setValue)
        .def("deny_delete", &profprune::MemoryStore::denyDelete)
        .def("delete_calls", &profprune::MemoryStore::deleteCalls)
        .def("key_count", &profprune::MemoryStore::keyCount);

    py::class_<profprune::DirectoryStore, profprune::KeyValueStore>(m, "DirectoryStore")
        .def(py::init([](const std::string& root) {
            return profprune::DirectoryStore(root);
        }), py::arg("root"));

    // ── ProfileEntry ──
    py::class_<profprune::ProfileEntry>(m, "ProfileEntry")
        .def(py::init<>())
        .def_readwrite("identity", &profprune::ProfileEntry::identity)
        .def_readwrite("image_path", &profprune::ProfileEntry::image_path)
        .def_readwrite("correlation_id", &profprune::ProfileEntry::correlation_id)
        .def_readwrite("location", &profprune::ProfileEntry::location);

    // ── DuplicateGroup ──
    py::class_<profprune::DuplicateGroup>(m, "DuplicateGroup")
        .def(py::init<>())
        .def_readwrite("image_path", &profprune::DuplicateGroup::image_path)
        .def_readwrite("members", &profprune::DuplicateGroup::members);

    // ── Configs ──
    py::class_<profprune::IdentityConfig>(m, "IdentityConfig")
        .def(py::init<>())
        .def_readwrite("standard_prefix", &profprune::IdentityConfig::standard_prefix);

    py::class_<profprune::RepositoryConfig>(m, "RepositoryConfig")
        .def(py::init<>())
        .def_readwrite("primary_root", &profprune::RepositoryConfig::primary_root)
        .def_readwrite("secondary_root", &profprune::RepositoryConfig::secondary_root)
        .def_readwrite("image_path_value", &profprune::RepositoryConfig::image_path_value)
        .def_readwrite("correlation_value", &profprune::RepositoryConfig::correlation_value);

    py::class_<profprune::BackupConfig>(m, "BackupConfig")
        .def(py::init<>())
        .def_readwrite("tool", &profprune::BackupConfig::tool)
        .def_readwrite("export_args", &profprune::BackupConfig::export_args)
        .def_readwrite("destination_dir", &profprune::BackupConfig::destination_dir)
        .def_readwrite("file_prefix", &profprune::BackupConfig::file_prefix)
        .def_readwrite("file_extension", &profprune::BackupConfig::file_extension);

    py::class_<profprune::PruneConfig>(m, "PruneConfig")
        .def(py::init<>())
        .def_readwrite("desired_prefix", &profprune::PruneConfig::desired_prefix)
        .def_readwrite("dry_run", &profprune::PruneConfig::dry_run)
        .def_readwrite("identity", &profprune::PruneConfig::identity)
        .def_readwrite("repository", &profprune::PruneConfig::repository)
        .def_readwrite("backup", &profprune::PruneConfig::backup);

    // ── Detection ──
    py::class_<profprune::IdentityMatcher>(m, "IdentityMatcher")
        .def(py::init<const std::string&>())
        .def("matches", &profprune::IdentityMatcher::matches)
        .def_property_readonly("prefix", &profprune::IdentityMatcher::prefix);

    py::class_<profprune::ProfileRepository>(m, "ProfileRepository")
        .def(py::init<const profprune::KeyValueStore&, profprune::RepositoryConfig>(),
             py::arg("store"), py::arg("config") = profprune::RepositoryConfig{},
             py::keep_alive<1, 2>())
        .def("load_entries", &profprune::ProfileRepository::loadEntries)
        .def("secondary_path", &profprune::ProfileRepository::secondaryPath)
        .def("secondary_exists", &profprune::ProfileRepository::secondaryExists);

    py::class_<profprune::DuplicateGrouper>(m, "DuplicateGrouper")
        .def(py::init<const profprune::IdentityConfig&>(),
             py::arg("config") = profprune::IdentityConfig{})
        .def("group", &profprune::DuplicateGrouper::group);

    py::class_<profprune::EligibilityFilter>(m, "EligibilityFilter")
        .def(py::init<const std::string&>(), py::arg("desired_prefix"))
        .def("is_protected", &profprune::EligibilityFilter::isProtected)
        .def("select_removable", &profprune::EligibilityFilter::selectRemovable);

    // ── Backup / deletion results ──
    py::enum_<profprune::Subtree>(m, "Subtree")
        .value("SECONDARY", profprune::Subtree::Secondary)
        .value("PRIMARY", profprune::Subtree::Primary);

    py::enum_<profprune::BackupFailure>(m, "BackupFailure")
        .value("NONE", profprune::BackupFailure::None)
        .value("TOOL_NOT_FOUND", profprune::BackupFailure::ToolNotFound)
        .value("EXPORT_FAILED", profprune::BackupFailure::ExportFailed);

    py::class_<profprune::BackupResult>(m, "BackupResult")
        .def(py::init<>())
        .def_readwrite("success", &profprune::BackupResult::success)
        .def_readwrite("failure", &profprune::BackupResult::failure)
        .def_readwrite("failed_subtree", &profprune::BackupResult::failed_subtree)
        .def_readwrite("files", &profprune::BackupResult::files)
        .def_readwrite("exit_code", &profprune::BackupResult::exit_code)
        .def_readwrite("tool_output", &profprune::BackupResult::tool_output)
        .def_readwrite("message", &profprune::BackupResult::message);

    py::class_<profprune::DeletionOutcome>(m, "DeletionOutcome")
        .def(py::init<>())
        .def_readwrite("entry", &profprune::DeletionOutcome::entry)
        .def_readwrite("removed", &profprune::DeletionOutcome::removed)
        .def_readwrite("secondary_removed", &profprune::DeletionOutcome::secondary_removed)
        .def_readwrite("cause", &profprune::DeletionOutcome::cause);

    py::class_<profprune::PruneReport>(m, "PruneReport")
        .def(py::init<>())
        .def_readwrite("groups", &profprune::PruneReport::groups)
        .def_readwrite("candidates", &profprune::PruneReport::candidates)
        .def_readwrite("backup", &profprune::PruneReport::backup)
        .def_readwrite("outcomes", &profprune::PruneReport::outcomes)
        .def_readwrite("dry_run", &profprune::PruneReport::dry_run)
        .def("removed_count", &profprune::PruneReport::removedCount)
        .def("failed_count", &profprune::PruneReport::failedCount);

    // ── Runner / Pruner ──
    py::class_<profprune::CommandRunner>(m, "CommandRunner");

    py::class_<profprune::ProcessRunner, profprune::CommandRunner>(m, "ProcessRunner")
        .def(py::init<>())
        .def("locate", &profprune::ProcessRunner::locate);

    py::class_<profprune::ProfilePruner>(m, "ProfilePruner")
        .def(py::init<profprune::KeyValueStore&, profprune::CommandRunner&, profprune::PruneConfig>(),
             py::arg("store"), py::arg("runner"), py::arg("config"),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("run", &profprune::ProfilePruner::run)
        .def("audit", &profprune::ProfilePruner::audit);

    m.def("default_prune_config", [](const std::string& desired_prefix) {
        profprune::PruneConfig config;
        config.desired_prefix = desired_prefix;
        return config;
    }, py::arg("desired_prefix"));
}
