/**
 * @file ReconciliationService.hpp
 * @brief Service computing and applying link create/remove actions.
 */

#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/ModEntry.hpp"
#include "domain/LinkOutcome.hpp"
#include "domain/NameResolver.hpp"
#include "domain/Settings.hpp"
#include "infrastructure/DirectoryScanner.hpp"

namespace modlink::application {

/**
 * @class ReconciliationService
 * @brief Reconciles the content root against the links root.
 *
 * Every operation isolates failures per item and turns them into ItemResult
 * values. Only configuration-level problems (an unusable content root for an
 * add) escape as domain::DirectoryUnavailable.
 *
 * No cross-process locking: a single operator running one instance at a time
 * is assumed. Link-name collisions rely on the atomicity of symlink creation.
 */
class ReconciliationService {
public:
    ReconciliationService(std::shared_ptr<domain::NameResolver> resolver, const domain::Settings& settings);

    /**
     * @brief Resolves, sanitizes and links a single identifier.
     * Never throws for per-item problems; the links root must already exist.
     */
    domain::ItemResult createLink(const std::string& identifier);

    /**
     * @brief Links explicitly requested identifiers (duplicates ignored).
     * @return One result per distinct identifier, ordered by identifier.
     * @throws domain::DirectoryUnavailable if the content root is unusable or
     *         the links root cannot be created.
     */
    std::vector<domain::ItemResult> createLinks(const std::vector<std::string>& identifiers);

    /**
     * @brief Links every identifier in the symmetric difference of content ids
     * and ids already targeted by links.
     * @throws domain::DirectoryUnavailable as for createLinks.
     */
    domain::SyncReport syncAll();

    /** @brief Removes the named symbolic links; never touches non-link paths. */
    std::vector<domain::ItemResult> removeLinks(const std::vector<std::string>& names);

    /** @brief Removes links whose target no longer exists. */
    domain::PruneReport pruneBroken();

    /** @brief Current links, sorted by name. */
    std::vector<domain::LinkEntry> listLinks() const;

    /**
     * @brief Identifiers present in exactly one of the content set and the linked set.
     * @return Sorted by identifier.
     */
    static std::vector<std::string> pendingIdentifiers(const std::vector<domain::ContentEntry>& content,
                                                       const std::vector<domain::LinkEntry>& links);

    const domain::Settings& settings() const { return m_settings; }

private:
    std::shared_ptr<domain::NameResolver> m_resolver;
    domain::Settings m_settings;
    infrastructure::DirectoryScanner m_scanner;
    std::mutex m_logMutex;

    void ensureLinksRoot();
    std::vector<domain::ItemResult> runCreateBatch(const std::vector<std::string>& identifiers);
    domain::ItemResult createLinkGuarded(const std::string& identifier);
    void logResult(const domain::ItemResult& result);
};

} // namespace modlink::application
