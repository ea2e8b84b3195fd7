#include "profile/identity_matcher.hpp"
#include <stdexcept>

namespace profprune {

std::string escapeRegex(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

IdentityMatcher::IdentityMatcher(const std::string& prefix) : prefix_(prefix) {
    if (prefix.empty()) {
        throw std::invalid_argument("Identity prefix must not be empty");
    }
    pattern_ = std::regex("^" + escapeRegex(prefix) + R"((-\d+)+$)",
                          std::regex::ECMAScript | std::regex::icase);
}

bool IdentityMatcher::matches(const std::string& identity) const {
    // std::regex recursion depth grows with input length.
    if (identity.size() > MAX_IDENTITY_LENGTH) return false;
    return std::regex_match(identity, pattern_);
}

IdentityMatcher IdentityMatcher::standardUser(const IdentityConfig& config) {
    return IdentityMatcher(config.standard_prefix);
}

} // namespace profprune
