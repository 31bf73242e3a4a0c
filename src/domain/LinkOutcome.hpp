/**
 * @file LinkOutcome.hpp
 * @brief Per-item results reported by the reconciliation operations.
 */

#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace modlink::domain {

/**
 * @enum LinkOutcome
 * @brief What happened to a single identifier or link name.
 */
enum class LinkOutcome {
    Created,           ///< New link written.
    AlreadyLinked,     ///< Same link already present; idempotent success.
    NameConflict,      ///< Name taken by a link to a different target.
    Unresolved,        ///< No usable name for the identifier.
    SourceMissing,     ///< Content directory absent.
    CreateFailed,      ///< Filesystem refused the link; see detail.
    InvalidIdentifier, ///< Requested identifier is not all digits.
    Removed,           ///< Link removed on request.
    NotFound,          ///< No symbolic link with that name.
    Pruned,            ///< Broken link removed.
    RemoveFailed       ///< Filesystem refused the removal; see detail.
};

inline std::string OutcomeToString(LinkOutcome outcome) {
    switch (outcome) {
        case LinkOutcome::Created: return "created";
        case LinkOutcome::AlreadyLinked: return "already linked";
        case LinkOutcome::NameConflict: return "name conflict";
        case LinkOutcome::Unresolved: return "unresolved";
        case LinkOutcome::SourceMissing: return "source missing";
        case LinkOutcome::CreateFailed: return "create failed";
        case LinkOutcome::InvalidIdentifier: return "invalid identifier";
        case LinkOutcome::Removed: return "removed";
        case LinkOutcome::NotFound: return "not found";
        case LinkOutcome::Pruned: return "pruned";
        case LinkOutcome::RemoveFailed: return "remove failed";
    }
    return "unknown";
}

/** @brief True for outcomes that leave the item in the desired state. */
inline bool IsSuccess(LinkOutcome outcome) {
    return outcome == LinkOutcome::Created ||
           outcome == LinkOutcome::AlreadyLinked ||
           outcome == LinkOutcome::Removed ||
           outcome == LinkOutcome::Pruned;
}

/**
 * @struct ItemResult
 * @brief Outcome for one identifier (create) or one link name (remove/prune).
 */
struct ItemResult {
    std::string item;       ///< Identifier or link name that was processed.
    LinkOutcome outcome;
    std::string linkName;   ///< Link name involved, when known.
    std::string detail;     ///< Underlying reason for failures.
};

/**
 * @struct SyncReport
 * @brief Result of reconciling the whole content root.
 */
struct SyncReport {
    bool allLinked = false;           ///< Nothing pending; results is empty.
    std::vector<ItemResult> results;  ///< Sorted by identifier.
};

/**
 * @struct PruneReport
 * @brief Result of removing broken links. Valid links are not listed.
 */
struct PruneReport {
    std::size_t checked = 0;          ///< Links inspected.
    std::size_t pruned = 0;           ///< Links removed.
    std::vector<ItemResult> results;  ///< Pruned or RemoveFailed entries, by link name.
};

} // namespace modlink::domain
