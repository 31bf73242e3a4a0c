/**
 * @file ModLinkApp.hpp
 * @brief Command surface of modlink: maps requested actions onto the reconciliation service.
 */

#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "application/ReconciliationService.hpp"

namespace modlink::app {

/**
 * @struct Actions
 * @brief Independent, combinable actions requested on the command line.
 */
struct Actions {
    bool list = false;
    bool add = false;
    std::vector<std::string> addIdentifiers;   ///< Empty means reconcile everything.
    bool unlink = false;
    std::vector<std::string> unlinkNames;
    bool pruneBroken = false;

    bool any() const { return list || add || unlink || pruneBroken; }
};

/**
 * @class ModLinkApp
 * @brief Runs the requested actions in order (list, add, unlink, prune) and prints reports.
 */
class ModLinkApp {
public:
    ModLinkApp(std::unique_ptr<application::ReconciliationService> service,
               std::ostream& out = std::cout,
               std::ostream& err = std::cerr);

    /**
     * @brief Executes every requested action.
     * @return 0, or 1 when an action hit a configuration-level failure.
     *         Per-item failures are printed but do not change the exit status.
     */
    int Run(const Actions& actions);

private:
    void List();
    void Add(const std::vector<std::string>& identifiers);
    void Unlink(const std::vector<std::string>& names);
    void PruneBroken();
    void PrintCreateResults(const std::vector<domain::ItemResult>& results);

    std::unique_ptr<application::ReconciliationService> m_service;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace modlink::app
