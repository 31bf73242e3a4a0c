/**
 * @file ModLinkApp.cpp
 * @brief Implementation of the ModLinkApp class.
 */
#include "app/ModLinkApp.hpp"

#include <iomanip>
#include <filesystem>

namespace modlink::app {

namespace {

constexpr int kNameColumnWidth = 40;
constexpr int kTableWidth = 90;

} // namespace

ModLinkApp::ModLinkApp(std::unique_ptr<application::ReconciliationService> service,
                       std::ostream& out,
                       std::ostream& err)
    : m_service(std::move(service)), m_out(out), m_err(err) {}

int ModLinkApp::Run(const Actions& actions) {
    int exitCode = 0;

    if (actions.list) {
        List();
    }

    if (actions.add) {
        try {
            Add(actions.addIdentifiers);
        } catch (const domain::DirectoryUnavailable& e) {
            m_err << "[modlink] " << e.what() << std::endl;
            exitCode = 1;
        }
    }

    if (actions.unlink) {
        Unlink(actions.unlinkNames);
    }

    if (actions.pruneBroken) {
        PruneBroken();
    }

    return exitCode;
}

void ModLinkApp::List() {
    auto links = m_service->listLinks();
    if (links.empty()) {
        m_out << "No links found in " << m_service->settings().linksRoot.string() << "." << std::endl;
        return;
    }

    m_out << std::left << std::setw(kNameColumnWidth) << "Title" << "Actual Path" << "\n";
    m_out << std::string(kTableWidth, '=') << "\n";
    for (const auto& link : links) {
        m_out << std::left << std::setw(kNameColumnWidth) << link.name << link.target.string();
        if (link.validity != domain::LinkValidity::Valid) {
            m_out << "  [" << domain::ValidityToString(link.validity) << "]";
        }
        m_out << "\n";
    }
    m_out.flush();
}

void ModLinkApp::Add(const std::vector<std::string>& identifiers) {
    if (identifiers.empty()) {
        auto report = m_service->syncAll();
        if (report.allLinked) {
            m_out << "All mods have already been linked." << std::endl;
            return;
        }
        PrintCreateResults(report.results);
        return;
    }
    PrintCreateResults(m_service->createLinks(identifiers));
}

void ModLinkApp::PrintCreateResults(const std::vector<domain::ItemResult>& results) {
    using domain::LinkOutcome;
    const auto linksRoot = m_service->settings().linksRoot;
    int created = 0;
    int unchanged = 0;
    int failed = 0;

    for (const auto& r : results) {
        switch (r.outcome) {
        case LinkOutcome::Created:
            m_out << "Linked " << r.linkName << " -> " << r.item << std::endl;
            created++;
            break;
        case LinkOutcome::AlreadyLinked:
            m_out << r.linkName << " is already linked to " << r.item << "." << std::endl;
            unchanged++;
            break;
        case LinkOutcome::Unresolved:
            m_out << "Unable to get title for " << r.item << " (" << r.detail << ")." << std::endl;
            failed++;
            break;
        case LinkOutcome::SourceMissing:
            m_out << "Unable to link " << r.item << ", content directory is missing: " << r.detail << "." << std::endl;
            failed++;
            break;
        case LinkOutcome::NameConflict:
            m_out << "Unable to link " << r.item << ", " << (linksRoot / r.linkName).string() << " " << r.detail << "." << std::endl;
            failed++;
            break;
        case LinkOutcome::InvalidIdentifier:
            m_out << "Ignoring " << r.item << ", " << r.detail << "." << std::endl;
            failed++;
            break;
        default:
            m_out << "Unable to create link for " << r.linkName << ", " << r.item << ", " << r.detail << "." << std::endl;
            failed++;
            break;
        }
    }

    m_out << created << " created, " << unchanged << " already linked, " << failed << " failed." << std::endl;
}

void ModLinkApp::Unlink(const std::vector<std::string>& names) {
    for (const auto& r : m_service->removeLinks(names)) {
        switch (r.outcome) {
        case domain::LinkOutcome::Removed:
            m_out << "Removed link " << r.item << "." << std::endl;
            break;
        case domain::LinkOutcome::NotFound:
            m_out << "Unable to remove link for " << r.item << ". No such symbolic link." << std::endl;
            break;
        default:
            m_out << "Unable to remove link for " << r.item << ". " << r.detail << "." << std::endl;
            break;
        }
    }
}

void ModLinkApp::PruneBroken() {
    auto report = m_service->pruneBroken();
    if (report.checked == 0) {
        m_out << "No links to check." << std::endl;
        return;
    }

    for (const auto& r : report.results) {
        if (r.outcome == domain::LinkOutcome::Pruned) {
            m_out << "Pruned " << r.item << " (" << r.detail << ")." << std::endl;
        } else {
            m_out << "Unable to remove " << r.item << ", " << r.detail << "." << std::endl;
        }
    }

    if (report.pruned == 0 && report.results.empty()) {
        m_out << "No broken links found." << std::endl;
    } else {
        m_out << "Removed " << report.pruned << " broken link(s)." << std::endl;
    }
}

} // namespace modlink::app
