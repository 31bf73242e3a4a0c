#pragma once

#include <string>

namespace modlink::domain {

/**
 * @brief Turns display names into filesystem-safe link names.
 * Stateless; performs no I/O.
 */
class NameSanitizer {
public:
    /**
     * @brief Replaces every byte outside [A-Za-z0-9_] with '_' and collapses runs of '_'.
     * @param raw Arbitrary display string (may be empty).
     * @return Sanitized name. Idempotent: Sanitize(Sanitize(x)) == Sanitize(x).
     */
    static std::string Sanitize(const std::string& raw);

    /** @brief False for empty names and names made only of underscores. */
    static bool IsUsableLinkName(const std::string& name);
};

} // namespace modlink::domain
