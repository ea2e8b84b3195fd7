#include "store/directory_store.hpp"
#include "store/key_path.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace profprune {

DirectoryStore::DirectoryStore(fs::path root) : root_(std::move(root)) {}

fs::path DirectoryStore::resolve(const std::string& path) const {
    fs::path result = root_;
    for (const auto& component : KeyPath::split(path)) {
        if (component == "." || component == "..") {
            throw StoreError(StoreErrorKind::NotFound, path, "invalid key name");
        }
        result /= component;
    }
    return result;
}

StoreErrorKind DirectoryStore::classify(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return StoreErrorKind::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return StoreErrorKind::AccessDenied;
    }
    return StoreErrorKind::Io;
}

std::vector<std::string> DirectoryStore::listChildren(const std::string& path) const {
    fs::path dir = resolve(path);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw StoreError(StoreErrorKind::NotFound, path);
    }

    std::vector<std::string> names;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        throw StoreError(classify(ec), path, ec.message());
    }

    std::sort(names.begin(), names.end());
    return names;
}

PropertyBag DirectoryStore::readProperties(const std::string& path) const {
    fs::path dir = resolve(path);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw StoreError(StoreErrorKind::NotFound, path);
    }

    PropertyBag values;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;

        std::ifstream in(it->path(), std::ios::binary);
        if (!in) {
            throw StoreError(StoreErrorKind::AccessDenied, path,
                             "cannot read value " + it->path().filename().string());
        }
        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (!data.empty() && data.back() == '\n') data.pop_back();
        if (!data.empty() && data.back() == '\r') data.pop_back();
        values[it->path().filename().string()] = data;
    }
    if (ec) {
        throw StoreError(classify(ec), path, ec.message());
    }
    return values;
}

void DirectoryStore::deleteRecursive(const std::string& path) {
    if (KeyPath::normalize(path).empty()) {
        throw StoreError(StoreErrorKind::AccessDenied, path, "cannot delete the root key");
    }

    fs::path dir = resolve(path);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw StoreError(StoreErrorKind::NotFound, path);
    }

    fs::remove_all(dir, ec);
    if (ec) {
        throw StoreError(classify(ec), path, ec.message());
    }
}

bool DirectoryStore::exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(resolve(path), ec);
}

} // namespace profprune
