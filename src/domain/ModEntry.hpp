/**
 * @file ModEntry.hpp
 * @brief Domain entities observed in the content root and the links root.
 */

#pragma once
#include <string>
#include <filesystem>
#include <stdexcept>

namespace modlink::domain {

/** @brief True when @p value is a non-empty string of ASCII decimal digits. */
inline bool IsIdentifier(const std::string& value) {
    if (value.empty()) return false;
    for (char ch : value) {
        if (ch < '0' || ch > '9') return false;
    }
    return true;
}

/** @brief Numeric ordering for digit strings (shorter first, then lexicographic). */
inline bool IdentifierLess(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return a.size() < b.size();
    return a < b;
}

/**
 * @struct ContentEntry
 * @brief A digit-named directory under the content root (one downloaded item).
 *
 * Never mutated by modlink; it only observes these.
 */
struct ContentEntry {
    std::string identifier;              ///< Digits only, e.g. "450814997".
    std::filesystem::path sourcePath;    ///< Absolute path of the directory.

    bool operator<(const ContentEntry& other) const {
        return IdentifierLess(identifier, other.identifier);
    }
};

/**
 * @enum LinkValidity
 * @brief State of a symbolic link's target at scan time.
 */
enum class LinkValidity {
    Valid,   ///< Target exists and is a content directory.
    Broken,  ///< Target missing or unresolvable.
    Foreign  ///< Target exists but is not a recognized content entry.
};

/**
 * @struct LinkEntry
 * @brief One symbolic link under the links root.
 */
struct LinkEntry {
    std::string name;                 ///< Filename of the link.
    std::filesystem::path target;     ///< Absolute, lexically normalized target.
    LinkValidity validity = LinkValidity::Broken;
};

inline std::string ValidityToString(LinkValidity v) {
    switch (v) {
        case LinkValidity::Valid: return "valid";
        case LinkValidity::Broken: return "broken";
        case LinkValidity::Foreign: return "foreign";
    }
    return "broken";
}

/**
 * @class DirectoryUnavailable
 * @brief A required root directory is missing or is not a directory.
 */
class DirectoryUnavailable : public std::runtime_error {
public:
    explicit DirectoryUnavailable(const std::filesystem::path& path, const std::string& reason = "not a directory")
        : std::runtime_error("Directory unavailable: " + path.string() + " (" + reason + ")"), m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace modlink::domain
