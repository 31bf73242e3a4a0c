/**
 * @file DirectoryScanner.hpp
 * @brief Snapshots of the content root and the links root.
 */

#pragma once
#include <vector>
#include <string>
#include <filesystem>
#include "domain/ModEntry.hpp"

namespace modlink::infrastructure {

/**
 * @class DirectoryScanner
 * @brief Infrastructure adapter enumerating content directories and existing links.
 */
class DirectoryScanner {
public:
    /**
     * @param contentRoot Directory of digit-named content folders. May be empty,
     *        in which case links are never classified as Foreign.
     * @param linksRoot Directory holding the symbolic links.
     */
    DirectoryScanner(const std::filesystem::path& contentRoot, const std::filesystem::path& linksRoot);

    /**
     * @brief Lists immediate digit-named subdirectories of the content root.
     * @return Entries ordered by identifier.
     * @throws domain::DirectoryUnavailable if the content root is missing or not a directory.
     */
    std::vector<domain::ContentEntry> listContentEntries() const;

    /**
     * @brief Lists the symbolic links directly under the links root.
     * A missing links root yields an empty list. Unresolvable links come back Broken.
     * @param sorted Sort by link name; pass false for bulk work where order does not matter.
     */
    std::vector<domain::LinkEntry> listLinkEntries(bool sorted = true) const;

    /** @brief Identifier embedded in a link target (its trailing path segment). */
    static std::string identifierOf(const domain::LinkEntry& link);

    /** @brief Absolute, lexically normal form of @p path without a trailing separator. */
    static std::filesystem::path normalizeDirectory(const std::filesystem::path& path);

private:
    std::filesystem::path m_contentRoot;
    std::filesystem::path m_linksRoot;

    domain::LinkValidity classifyTarget(const std::filesystem::path& linkPath,
                                        const std::filesystem::path& target) const;
};

} // namespace modlink::infrastructure
