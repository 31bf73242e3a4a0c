/**
 * @file ReconciliationService.cpp
 * @brief Implementation of ReconciliationService.
 */

#include "application/ReconciliationService.hpp"
#include "domain/NameSanitizer.hpp"
#include <algorithm>
#include <filesystem>
#include <future>
#include <iostream>
#include <iterator>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace modlink::application {

namespace {

domain::ItemResult MakeResult(const std::string& item, domain::LinkOutcome outcome,
                              const std::string& linkName = "", const std::string& detail = "") {
    return domain::ItemResult{item, outcome, linkName, detail};
}

bool IsPlainName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

bool SameDirectory(const fs::path& a, const fs::path& b) {
    if (a == b) return true;
    std::error_code ec;
    return fs::equivalent(a, b, ec) && !ec;
}

// Missing means the target is positively gone or can never resolve (a symlink
// loop); an unreadable target (EACCES) is not.
bool TargetMissing(const fs::path& linkPath) {
    std::error_code ec;
    fs::file_status status = fs::status(linkPath, ec);
    if (ec == std::errc::too_many_symbolic_link_levels) {
        return true;
    }
    return status.type() == fs::file_type::not_found;
}

} // namespace

ReconciliationService::ReconciliationService(std::shared_ptr<domain::NameResolver> resolver,
                                             const domain::Settings& settings)
    : m_resolver(std::move(resolver)),
      m_settings(settings),
      m_scanner(settings.contentRoot, settings.linksRoot) {}

domain::ItemResult ReconciliationService::createLink(const std::string& identifier) {
    using domain::LinkOutcome;

    if (!domain::IsIdentifier(identifier)) {
        return MakeResult(identifier, LinkOutcome::InvalidIdentifier, "", "identifiers are digits only");
    }

    auto nameCase = m_settings.lowercaseNames ? domain::NameCase::Lower : domain::NameCase::AsPublished;
    auto displayName = m_resolver->resolve(identifier, nameCase);
    if (!displayName) {
        return MakeResult(identifier, LinkOutcome::Unresolved, "", "no title available");
    }

    std::string linkName = domain::NameSanitizer::Sanitize(*displayName);
    if (!domain::NameSanitizer::IsUsableLinkName(linkName)) {
        return MakeResult(identifier, LinkOutcome::Unresolved, "", "title \"" + *displayName + "\" has no usable characters");
    }

    const fs::path source = infrastructure::DirectoryScanner::normalizeDirectory(m_settings.contentRoot) / identifier;
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        return MakeResult(identifier, LinkOutcome::SourceMissing, linkName, source.string());
    }

    const fs::path linksRoot = infrastructure::DirectoryScanner::normalizeDirectory(m_settings.linksRoot);
    const fs::path linkPath = linksRoot / linkName;

    fs::create_directory_symlink(source, linkPath, ec);
    if (!ec) {
        return MakeResult(identifier, LinkOutcome::Created, linkName);
    }
    if (ec != std::errc::file_exists) {
        return MakeResult(identifier, LinkOutcome::CreateFailed, linkName, ec.message());
    }

    std::error_code statEc;
    if (!fs::is_symlink(fs::symlink_status(linkPath, statEc))) {
        return MakeResult(identifier, LinkOutcome::CreateFailed, linkName, "exists and is not a symbolic link");
    }
    fs::path existing = fs::read_symlink(linkPath, statEc);
    if (statEc) {
        return MakeResult(identifier, LinkOutcome::CreateFailed, linkName, statEc.message());
    }
    existing = infrastructure::DirectoryScanner::normalizeDirectory(existing.is_absolute() ? existing : linksRoot / existing);
    if (SameDirectory(existing, source)) {
        return MakeResult(identifier, LinkOutcome::AlreadyLinked, linkName);
    }
    return MakeResult(identifier, LinkOutcome::NameConflict, linkName, "already points to " + existing.string());
}

domain::ItemResult ReconciliationService::createLinkGuarded(const std::string& identifier) {
    domain::ItemResult result;
    try {
        result = createLink(identifier);
    } catch (const std::exception& e) {
        result = MakeResult(identifier, domain::LinkOutcome::CreateFailed, "", e.what());
    }
    logResult(result);
    return result;
}

std::vector<domain::ItemResult> ReconciliationService::runCreateBatch(const std::vector<std::string>& identifiers) {
    std::vector<domain::ItemResult> results;
    results.reserve(identifiers.size());

    if (m_settings.jobs <= 1 || identifiers.size() < 2) {
        for (const auto& id : identifiers) {
            results.push_back(createLinkGuarded(id));
        }
        return results;
    }

    // Windows of at most `jobs` lookups; results are collected in input order.
    const std::size_t window = static_cast<std::size_t>(m_settings.jobs);
    for (std::size_t start = 0; start < identifiers.size(); start += window) {
        std::size_t end = std::min(identifiers.size(), start + window);
        std::vector<std::future<domain::ItemResult>> pending;
        pending.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            const std::string id = identifiers[i];
            auto task = [this, id]() { return createLinkGuarded(id); };
            try {
                pending.push_back(std::async(std::launch::async, task));
            } catch (const std::system_error& e) {
                // No thread available: run this one on the caller when collected.
                std::cerr << "[Reconciliation] Cannot start worker for " << id << ": " << e.what() << std::endl;
                pending.push_back(std::async(std::launch::deferred, task));
            }
        }
        for (std::size_t i = 0; i < pending.size(); ++i) {
            try {
                results.push_back(pending[i].get());
            } catch (const std::exception& e) {
                results.push_back(MakeResult(identifiers[start + i], domain::LinkOutcome::CreateFailed, "", e.what()));
            }
        }
    }
    return results;
}

void ReconciliationService::ensureLinksRoot() {
    std::error_code ec;
    if (fs::is_directory(m_settings.linksRoot, ec)) {
        return;
    }
    if (fs::exists(m_settings.linksRoot, ec)) {
        throw domain::DirectoryUnavailable(m_settings.linksRoot, "not a directory");
    }
    fs::create_directories(m_settings.linksRoot, ec);
    if (ec) {
        throw domain::DirectoryUnavailable(m_settings.linksRoot, ec.message());
    }
    std::cout << "[Reconciliation] Created links root " << m_settings.linksRoot.string() << std::endl;
}

std::vector<domain::ItemResult> ReconciliationService::createLinks(const std::vector<std::string>& identifiers) {
    std::error_code ec;
    if (!fs::is_directory(m_settings.contentRoot, ec)) {
        throw domain::DirectoryUnavailable(m_settings.contentRoot,
                                           fs::exists(m_settings.contentRoot, ec) ? "not a directory" : "does not exist");
    }
    ensureLinksRoot();

    std::vector<std::string> ordered(identifiers.begin(), identifiers.end());
    std::sort(ordered.begin(), ordered.end(), domain::IdentifierLess);
    ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());
    return runCreateBatch(ordered);
}

std::vector<std::string> ReconciliationService::pendingIdentifiers(const std::vector<domain::ContentEntry>& content,
                                                                   const std::vector<domain::LinkEntry>& links) {
    std::set<std::string> contentIds;
    for (const auto& entry : content) {
        contentIds.insert(entry.identifier);
    }
    std::set<std::string> linkedIds;
    for (const auto& link : links) {
        std::string id = infrastructure::DirectoryScanner::identifierOf(link);
        if (!id.empty()) {
            linkedIds.insert(id);
        }
    }

    // Ids that only appear as link targets are kept: they get a CreateLink
    // attempt too, which ends in SourceMissing once their content is gone.
    std::vector<std::string> pending;
    std::set_symmetric_difference(contentIds.begin(), contentIds.end(),
                                  linkedIds.begin(), linkedIds.end(),
                                  std::back_inserter(pending));
    std::sort(pending.begin(), pending.end(), domain::IdentifierLess);
    return pending;
}

domain::SyncReport ReconciliationService::syncAll() {
    domain::SyncReport report;

    auto content = m_scanner.listContentEntries();
    auto links = m_scanner.listLinkEntries(false);
    auto pending = pendingIdentifiers(content, links);

    if (m_settings.verbose) {
        std::cout << "[Reconciliation] " << content.size() << " content entries, " << links.size()
                  << " links, " << pending.size() << " pending" << std::endl;
    }

    if (pending.empty()) {
        report.allLinked = true;
        return report;
    }

    ensureLinksRoot();
    report.results = runCreateBatch(pending);
    return report;
}

std::vector<domain::ItemResult> ReconciliationService::removeLinks(const std::vector<std::string>& names) {
    std::vector<domain::ItemResult> results;
    const fs::path linksRoot = infrastructure::DirectoryScanner::normalizeDirectory(m_settings.linksRoot);

    for (const auto& name : names) {
        if (!IsPlainName(name)) {
            results.push_back(MakeResult(name, domain::LinkOutcome::NotFound, name));
            continue;
        }

        const fs::path linkPath = linksRoot / name;
        std::error_code ec;
        fs::file_status status = fs::symlink_status(linkPath, ec);
        if (ec || !fs::is_symlink(status)) {
            results.push_back(MakeResult(name, domain::LinkOutcome::NotFound, name));
            continue;
        }

        fs::remove(linkPath, ec);
        if (ec) {
            results.push_back(MakeResult(name, domain::LinkOutcome::RemoveFailed, name, ec.message()));
        } else {
            results.push_back(MakeResult(name, domain::LinkOutcome::Removed, name));
        }
        logResult(results.back());
    }
    return results;
}

domain::PruneReport ReconciliationService::pruneBroken() {
    domain::PruneReport report;
    const fs::path linksRoot = infrastructure::DirectoryScanner::normalizeDirectory(m_settings.linksRoot);

    auto links = m_scanner.listLinkEntries();
    report.checked = links.size();

    for (const auto& link : links) {
        if (link.validity != domain::LinkValidity::Broken) {
            continue;
        }
        const fs::path linkPath = linksRoot / link.name;
        if (!TargetMissing(linkPath)) {
            std::cerr << "[Reconciliation] Skipping " << link.name << ": target not confirmed missing" << std::endl;
            continue;
        }

        std::error_code ec;
        fs::remove(linkPath, ec);
        if (ec) {
            report.results.push_back(MakeResult(link.name, domain::LinkOutcome::RemoveFailed, link.name, ec.message()));
        } else {
            report.results.push_back(MakeResult(link.name, domain::LinkOutcome::Pruned, link.name, link.target.string()));
            report.pruned++;
        }
        logResult(report.results.back());
    }
    return report;
}

std::vector<domain::LinkEntry> ReconciliationService::listLinks() const {
    return m_scanner.listLinkEntries();
}

void ReconciliationService::logResult(const domain::ItemResult& result) {
    if (!m_settings.verbose) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_logMutex);
    std::cout << "[Reconciliation] " << result.item << ": " << domain::OutcomeToString(result.outcome);
    if (!result.linkName.empty() && result.linkName != result.item) {
        std::cout << " (" << result.linkName << ")";
    }
    std::cout << std::endl;
}

} // namespace modlink::application
