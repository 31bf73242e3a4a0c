/**
 * @file NameResolver.hpp
 * @brief Interface for identifier to display-name lookup.
 */

#pragma once
#include <string>
#include <optional>

namespace modlink::domain {

/**
 * @enum NameCase
 * @brief Case policy requested from the resolver.
 */
enum class NameCase {
    Lower,       ///< Lowercased display name (default).
    AsPublished  ///< Name exactly as the remote catalog publishes it.
};

/**
 * @class NameResolver
 * @brief Abstract interface for services that map an identifier to a display name.
 *
 * Every failure mode (timeout, malformed response, unknown identifier) collapses
 * to std::nullopt. Implementations must tolerate concurrent calls.
 */
class NameResolver {
public:
    virtual ~NameResolver() = default;

    /**
     * @brief Looks up the display name of an identifier.
     * @param identifier Digit-only catalog id.
     * @param nameCase Requested case; callers must accept either case in the result.
     * @return The display name, or std::nullopt when no name is available.
     */
    virtual std::optional<std::string> resolve(const std::string& identifier, NameCase nameCase = NameCase::Lower) = 0;
};

} // namespace modlink::domain
