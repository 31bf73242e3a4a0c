/**
 * @file DirectoryScanner.cpp
 * @brief Implementation of the DirectoryScanner.
 */

#include "infrastructure/DirectoryScanner.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace modlink::infrastructure {

DirectoryScanner::DirectoryScanner(const fs::path& contentRoot, const fs::path& linksRoot)
    : m_contentRoot(contentRoot), m_linksRoot(linksRoot) {}

fs::path DirectoryScanner::normalizeDirectory(const fs::path& path) {
    std::error_code ec;
    fs::path result = fs::absolute(path, ec);
    if (ec) {
        result = path;
    }
    result = result.lexically_normal();
    if (!result.has_filename() && result.has_parent_path() && result != result.root_path()) {
        result = result.parent_path();
    }
    return result;
}

std::vector<domain::ContentEntry> DirectoryScanner::listContentEntries() const {
    std::error_code ec;
    if (!fs::exists(m_contentRoot, ec)) {
        throw domain::DirectoryUnavailable(m_contentRoot, "does not exist");
    }
    if (!fs::is_directory(m_contentRoot, ec)) {
        throw domain::DirectoryUnavailable(m_contentRoot, "not a directory");
    }

    const fs::path root = normalizeDirectory(m_contentRoot);
    std::vector<domain::ContentEntry> entries;

    fs::directory_iterator it(root, ec);
    if (ec) {
        throw domain::DirectoryUnavailable(m_contentRoot, ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_directory(entryEc)) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (!domain::IsIdentifier(name)) {
            continue;
        }
        entries.push_back({name, root / name});
    }
    if (ec) {
        std::cerr << "[DirectoryScanner] Stopped reading " << root << ": " << ec.message() << std::endl;
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

std::vector<domain::LinkEntry> DirectoryScanner::listLinkEntries(bool sorted) const {
    std::vector<domain::LinkEntry> links;
    std::error_code ec;

    if (!fs::exists(m_linksRoot, ec)) {
        return links;
    }
    if (!fs::is_directory(m_linksRoot, ec)) {
        std::cerr << "[DirectoryScanner] Links root is not a directory: " << m_linksRoot << std::endl;
        return links;
    }

    const fs::path root = normalizeDirectory(m_linksRoot);
    fs::directory_iterator it(root, ec);
    if (ec) {
        std::cerr << "[DirectoryScanner] Cannot read " << root << ": " << ec.message() << std::endl;
        return links;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_symlink(entryEc)) {
            continue;
        }

        domain::LinkEntry link;
        link.name = it->path().filename().string();

        fs::path raw = fs::read_symlink(it->path(), entryEc);
        if (entryEc) {
            link.validity = domain::LinkValidity::Broken;
            links.push_back(link);
            continue;
        }

        // Relative targets are relative to the directory holding the link.
        link.target = normalizeDirectory(raw.is_absolute() ? raw : root / raw);
        link.validity = classifyTarget(it->path(), link.target);
        links.push_back(link);
    }
    if (ec) {
        std::cerr << "[DirectoryScanner] Stopped reading " << root << ": " << ec.message() << std::endl;
    }

    if (sorted) {
        std::sort(links.begin(), links.end(),
                  [](const domain::LinkEntry& a, const domain::LinkEntry& b) { return a.name < b.name; });
    }
    return links;
}

domain::LinkValidity DirectoryScanner::classifyTarget(const fs::path& linkPath, const fs::path& target) const {
    std::error_code ec;
    fs::file_status status = fs::status(linkPath, ec);
    if (ec || !fs::exists(status)) {
        return domain::LinkValidity::Broken;
    }
    if (!fs::is_directory(status)) {
        return domain::LinkValidity::Foreign;
    }
    if (m_contentRoot.empty()) {
        return domain::LinkValidity::Valid;
    }

    if (!domain::IsIdentifier(target.filename().string())) {
        return domain::LinkValidity::Foreign;
    }
    const fs::path contentRoot = normalizeDirectory(m_contentRoot);
    if (target.parent_path() == contentRoot) {
        return domain::LinkValidity::Valid;
    }
    // Same directory reached through a different spelling (e.g. a symlinked root).
    if (fs::equivalent(target.parent_path(), contentRoot, ec) && !ec) {
        return domain::LinkValidity::Valid;
    }
    return domain::LinkValidity::Foreign;
}

std::string DirectoryScanner::identifierOf(const domain::LinkEntry& link) {
    return link.target.filename().string();
}

} // namespace modlink::infrastructure
