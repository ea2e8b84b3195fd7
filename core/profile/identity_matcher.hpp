#pragma once

#include <cstddef>
#include <regex>
#include <string>

namespace profprune {

/// Identity pattern settings.
struct IdentityConfig {
    // Domain-class prefix of a standard (local or domain) user identity.
    std::string standard_prefix = "S-1-5-21";
};

/// Escape every regex metacharacter so the text matches literally.
std::string escapeRegex(const std::string& text);

// ─── Identity Matcher ──────────────────────────────────────────
// Compiled once, matches identities of the form
//     <prefix>-<digits>[-<digits>...]
// over the whole identity, case-insensitively. The prefix is literal.

class IdentityMatcher {
public:
    /// Throws std::invalid_argument if prefix is empty.
    explicit IdentityMatcher(const std::string& prefix);

    /// Identities longer than MAX_IDENTITY_LENGTH never match.
    bool matches(const std::string& identity) const;

    // Well above the longest real identity (15 sub-authorities).
    static constexpr size_t MAX_IDENTITY_LENGTH = 256;

    const std::string& prefix() const { return prefix_; }

    /// Matcher for standard user identities.
    static IdentityMatcher standardUser(const IdentityConfig& config = {});

private:
    std::string prefix_;
    std::regex pattern_;
};

} // namespace profprune
