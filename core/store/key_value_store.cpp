#include "store/key_value_store.hpp"

namespace profprune {

const char* toString(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::NotFound:     return "not found";
        case StoreErrorKind::AccessDenied: return "access denied";
        case StoreErrorKind::Io:           return "I/O error";
    }
    return "unknown";
}

namespace {

std::string formatStoreError(StoreErrorKind kind, const std::string& path,
                             const std::string& detail) {
    std::string msg = std::string("Key ") + toString(kind) + ": " + path;
    if (!detail.empty()) {
        msg += " (" + detail + ")";
    }
    return msg;
}

} // namespace

StoreError::StoreError(StoreErrorKind kind, const std::string& path, const std::string& detail)
    : std::runtime_error(formatStoreError(kind, path, detail)),
      kind_(kind),
      path_(path) {}

} // namespace profprune
