#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <unistd.h>

#include "application/ReconciliationService.hpp"
#include "FakeNameResolver.hpp"

namespace fs = std::filesystem;
using namespace modlink;
using domain::LinkOutcome;

namespace {

struct Fixture {
    fs::path root;
    fs::path content;
    fs::path links;

    explicit Fixture(const std::string& name) {
        root = fs::absolute("test_modlink_" + name);
        fs::remove_all(root);
        content = root / "content";
        links = root / "links";
        fs::create_directories(content);
    }
    ~Fixture() { fs::remove_all(root); }

    domain::Settings settings(int jobs = 1) const {
        domain::Settings s;
        s.contentRoot = content;
        s.linksRoot = links;
        s.jobs = jobs;
        return s;
    }

    std::set<std::string> linkNames() const {
        std::set<std::string> names;
        if (!fs::exists(links)) return names;
        for (const auto& entry : fs::directory_iterator(links)) {
            if (entry.is_symlink()) names.insert(entry.path().filename().string());
        }
        return names;
    }
};

void testCreateLinkIsIdempotent() {
    Fixture fx("idempotent");
    fs::create_directories(fx.content / "450814997");
    fs::create_directories(fx.links);
    auto resolver = std::make_shared<FakeNameResolver>(std::map<std::string, std::string>{{"450814997", "CBA_A3"}});
    application::ReconciliationService service(resolver, fx.settings());

    auto first = service.createLink("450814997");
    assert(first.outcome == LinkOutcome::Created);
    assert(first.linkName == "cba_a3");
    assert(fs::read_symlink(fx.links / "cba_a3") == fx.content / "450814997");

    auto second = service.createLink("450814997");
    assert(second.outcome == LinkOutcome::AlreadyLinked);
    assert(fx.linkNames() == std::set<std::string>{"cba_a3"});
    assert(resolver->lastCase == domain::NameCase::Lower);
    std::cout << "[PASS] CreateLink is idempotent." << std::endl;
}

void testCreateLinkFailures() {
    Fixture fx("create_failures");
    fs::create_directories(fx.links);
    fs::create_directories(fx.content / "1");
    fs::create_directories(fx.content / "2");
    fs::create_directories(fx.content / "3");
    auto resolver = std::make_shared<FakeNameResolver>(std::map<std::string, std::string>{
        {"1", "!!! ???"}, {"2", "taken"}, {"3", "occupied"}, {"4", "gone"}, {"5", "@@@"}});
    application::ReconciliationService service(resolver, fx.settings());

    // An all-symbol title sanitizes to "_" and is treated as unresolved.
    assert(service.createLink("1").outcome == LinkOutcome::Unresolved);
    assert(service.createLink("5").outcome == LinkOutcome::Unresolved);
    // Unknown to the resolver.
    assert(service.createLink("6").outcome == LinkOutcome::Unresolved);
    // Resolved but content directory absent.
    auto missing = service.createLink("4");
    assert(missing.outcome == LinkOutcome::SourceMissing);
    assert(fx.linkNames().empty());

    // Same name already linked to another target.
    fs::create_directory_symlink(fx.content / "3", fx.links / "taken");
    auto conflict = service.createLink("2");
    assert(conflict.outcome == LinkOutcome::NameConflict);
    assert(fs::read_symlink(fx.links / "taken") == fx.content / "3");

    // A real directory occupying the name is never replaced.
    fs::create_directories(fx.links / "occupied");
    auto occupied = service.createLink("3");
    assert(occupied.outcome == LinkOutcome::CreateFailed);
    assert(!occupied.detail.empty());
    assert(fs::is_directory(fx.links / "occupied") && !fs::is_symlink(fx.links / "occupied"));

    int callsBefore = resolver->calls.load();
    assert(service.createLink("12a").outcome == LinkOutcome::InvalidIdentifier);
    assert(resolver->calls.load() == callsBefore);
    std::cout << "[PASS] CreateLink failure outcomes." << std::endl;
}

void testSymmetricDifference() {
    Fixture fx("symmetric");
    for (const char* id : {"1", "2", "3", "4"}) {
        fs::create_directories(fx.content / id);
    }
    fs::create_directories(fx.links);
    fs::create_directory_symlink(fx.content / "2", fx.links / "two");
    fs::create_directory_symlink(fx.content / "3", fx.links / "three");
    fs::create_directory_symlink(fx.content / "4", fx.links / "four");
    fs::remove_all(fx.content / "4");

    auto resolver = std::make_shared<FakeNameResolver>(std::map<std::string, std::string>{
        {"1", "One"}, {"2", "Two"}, {"3", "Three"}, {"4", "Four"}});
    application::ReconciliationService service(resolver, fx.settings());

    infrastructure::DirectoryScanner scanner(fx.content, fx.links);
    auto pending = application::ReconciliationService::pendingIdentifiers(scanner.listContentEntries(),
                                                                          scanner.listLinkEntries());
    assert((pending == std::vector<std::string>{"1", "4"}));

    auto report = service.syncAll();
    assert(!report.allLinked);
    assert(report.results.size() == 2);
    assert(report.results[0].item == "1");
    assert(report.results[0].outcome == LinkOutcome::Created);
    assert(report.results[1].item == "4");
    assert(report.results[1].outcome == LinkOutcome::SourceMissing);
    assert(resolver->calls.load() == 2);
    std::cout << "[PASS] SyncAll processes the symmetric difference." << std::endl;
}

void testAllLinked() {
    Fixture fx("all_linked");
    fs::create_directories(fx.content / "10");
    fs::create_directories(fx.links);
    fs::create_directory_symlink(fx.content / "10", fx.links / "ten");
    auto resolver = std::make_shared<FakeNameResolver>();
    application::ReconciliationService service(resolver, fx.settings());

    auto report = service.syncAll();
    assert(report.allLinked);
    assert(report.results.empty());
    assert(resolver->calls.load() == 0);
    std::cout << "[PASS] SyncAll reports AllLinked." << std::endl;
}

void testEndToEnd() {
    Fixture fx("end_to_end");
    fs::create_directories(fx.content / "111");
    fs::create_directories(fx.content / "222");
    auto resolver = std::make_shared<FakeNameResolver>(std::map<std::string, std::string>{{"111", "Alpha Mod"}});
    application::ReconciliationService service(resolver, fx.settings());

    auto report = service.syncAll();
    assert(report.results.size() == 2);
    assert(report.results[0].item == "111" && report.results[0].outcome == LinkOutcome::Created);
    assert(report.results[0].linkName == "alpha_mod");
    assert(report.results[1].item == "222" && report.results[1].outcome == LinkOutcome::Unresolved);
    assert(fx.linkNames() == std::set<std::string>{"alpha_mod"});
    assert(fs::read_symlink(fx.links / "alpha_mod") == fx.content / "111");

    // Re-running retries only what is still unlinked.
    resolver->set("222", "Beta");
    auto rerun = service.syncAll();
    assert(rerun.results.size() == 1);
    assert(rerun.results[0].item == "222" && rerun.results[0].outcome == LinkOutcome::Created);
    assert((fx.linkNames() == std::set<std::string>{"alpha_mod", "beta"}));
    std::cout << "[PASS] End-to-end add." << std::endl;
}

void testExplicitAddRequiresContentRoot() {
    Fixture fx("explicit_add");
    fs::remove_all(fx.content);
    auto resolver = std::make_shared<FakeNameResolver>(std::map<std::string, std::string>{{"7", "Seven"}});
    application::ReconciliationService service(resolver, fx.settings());

    bool thrown = false;
    try {
        service.createLinks({"7"});
    } catch (const domain::DirectoryUnavailable&) {
        thrown = true;
    }
    assert(thrown);
    assert(resolver->calls.load() == 0);

    fs::create_directories(fx.content / "7");
    auto results = service.createLinks({"7", "7", "8"});
    assert(results.size() == 2);
    assert(results[0].item == "7" && results[0].outcome == LinkOutcome::Created);
    assert(results[1].item == "8" && results[1].outcome == LinkOutcome::Unresolved);
    std::cout << "[PASS] Explicit add." << std::endl;
}

void testRemoveLinks() {
    Fixture fx("remove");
    fs::create_directories(fx.content / "1");
    fs::create_directories(fx.links / "real_dir");
    std::ofstream(fx.links / "real_file") << "x";
    fs::create_directory_symlink(fx.content / "1", fx.links / "one");
    application::ReconciliationService service(std::make_shared<FakeNameResolver>(), fx.settings());

    auto results = service.removeLinks({"one", "real_dir", "real_file", "missing", "../links/one", ".."});
    assert(results.size() == 6);
    assert(results[0].outcome == LinkOutcome::Removed);
    for (std::size_t i = 1; i < results.size(); ++i) {
        assert(results[i].outcome == LinkOutcome::NotFound);
    }
    assert(!fs::exists(fs::symlink_status(fx.links / "one")));
    assert(fs::is_directory(fx.links / "real_dir"));
    assert(fs::is_regular_file(fx.links / "real_file"));
    assert(fs::is_directory(fx.content / "1"));
    std::cout << "[PASS] RemoveLinks never deletes a non-symlink." << std::endl;
}

void testPruneBroken() {
    Fixture fx("prune");
    fs::create_directories(fx.content / "1");
    fs::create_directories(fx.content / "2");
    fs::create_directories(fx.links);
    fs::create_directory_symlink(fx.content / "1", fx.links / "valid");
    fs::create_directory_symlink(fx.content / "2", fx.links / "stale");
    fs::remove_all(fx.content / "2");
    application::ReconciliationService service(std::make_shared<FakeNameResolver>(), fx.settings());

    auto report = service.pruneBroken();
    assert(report.checked == 2);
    assert(report.pruned == 1);
    assert(report.results.size() == 1);
    assert(report.results[0].item == "stale" && report.results[0].outcome == LinkOutcome::Pruned);
    assert(fx.linkNames() == std::set<std::string>{"valid"});
    assert(fs::read_symlink(fx.links / "valid") == fx.content / "1");

    auto again = service.pruneBroken();
    assert(again.checked == 1 && again.pruned == 0 && again.results.empty());

    // Links that can never resolve (a self loop, a two-link cycle) are broken too.
    fs::create_symlink("self", fx.links / "self");
    fs::create_symlink("loop_b", fx.links / "loop_a");
    fs::create_symlink("loop_a", fx.links / "loop_b");
    auto loops = service.listLinks();
    assert(loops.size() == 4);
    for (const auto& link : loops) {
        if (link.name != "valid") assert(link.validity == domain::LinkValidity::Broken);
    }
    auto looped = service.pruneBroken();
    assert(looped.checked == 4);
    assert(looped.pruned == 3);
    assert(looped.results.size() == 3);
    assert(looped.results[0].item == "loop_a" && looped.results[0].outcome == LinkOutcome::Pruned);
    assert(looped.results[2].item == "self" && looped.results[2].outcome == LinkOutcome::Pruned);
    assert(fx.linkNames() == std::set<std::string>{"valid"});

    Fixture empty("prune_empty");
    application::ReconciliationService emptyService(std::make_shared<FakeNameResolver>(), empty.settings());
    auto none = emptyService.pruneBroken();
    assert(none.checked == 0 && none.pruned == 0);
    std::cout << "[PASS] PruneBroken removes only broken links." << std::endl;
}

void testPruneSkipsUnreadableTargets() {
    if (geteuid() == 0) {
        std::cout << "[SKIP] Unreadable targets (permissions are not enforced for root)." << std::endl;
        return;
    }
    Fixture fx("prune_unreadable");
    fs::path locked = fx.root / "locked";
    fs::create_directories(locked / "inner");
    fs::create_directories(fx.links);
    fs::create_directory_symlink(locked / "inner", fx.links / "hidden");
    fs::permissions(locked, fs::perms::none);
    application::ReconciliationService service(std::make_shared<FakeNameResolver>(), fx.settings());

    auto links = service.listLinks();
    assert(links.size() == 1 && links[0].validity == domain::LinkValidity::Broken);
    auto report = service.pruneBroken();
    assert(report.checked == 1);
    assert(report.pruned == 0);
    assert(report.results.empty());
    assert(fs::is_symlink(fs::symlink_status(fx.links / "hidden")));

    fs::permissions(locked, fs::perms::owner_all);
    std::cout << "[PASS] PruneBroken skips links whose target cannot be checked." << std::endl;
}

void testLinksRootIsFile() {
    Fixture fx("links_file");
    fs::create_directories(fx.content / "5");
    std::ofstream(fx.links) << "not a directory";
    auto resolver = std::make_shared<FakeNameResolver>(std::map<std::string, std::string>{{"5", "Five"}});
    application::ReconciliationService service(resolver, fx.settings());

    bool thrown = false;
    try {
        service.syncAll();
    } catch (const domain::DirectoryUnavailable& e) {
        thrown = true;
        assert(e.path() == fx.links);
    }
    assert(thrown);

    thrown = false;
    try {
        service.createLinks({"5"});
    } catch (const domain::DirectoryUnavailable&) {
        thrown = true;
    }
    assert(thrown);
    assert(resolver->calls == 0);
    assert(fs::is_regular_file(fx.links));
    std::cout << "[PASS] A file at the links root is DirectoryUnavailable." << std::endl;
}

void testParallelSyncKeepsOrder() {
    Fixture fx("parallel");
    std::map<std::string, std::string> titles;
    for (int i = 1; i <= 25; ++i) {
        std::string id = std::to_string(i * 7);
        fs::create_directories(fx.content / id);
        if (i % 5 != 0) titles[id] = "Mod number " + id;
    }
    // Two ids competing for the same link name.
    fs::create_directories(fx.content / "1000");
    fs::create_directories(fx.content / "1001");
    titles["1000"] = "Shared Name";
    titles["1001"] = "shared name";
    auto resolver = std::make_shared<FakeNameResolver>(titles);
    domain::Settings settings = fx.settings(4);
    settings.lowercaseNames = false;
    application::ReconciliationService service(resolver, settings);

    auto report = service.syncAll();
    assert(report.results.size() == 27);
    for (std::size_t i = 1; i < report.results.size(); ++i) {
        assert(domain::IdentifierLess(report.results[i - 1].item, report.results[i].item));
    }
    int created = 0;
    int unresolved = 0;
    for (const auto& r : report.results) {
        if (r.outcome == LinkOutcome::Created) created++;
        if (r.outcome == LinkOutcome::Unresolved) unresolved++;
    }
    // "Shared Name" and "shared name" differ in case, so both link.
    assert(created == 22);
    assert(unresolved == 5);
    assert(resolver->lastCase == domain::NameCase::AsPublished);
    std::cout << "[PASS] Parallel SyncAll reports in identifier order." << std::endl;
}

void testParallelNameCollision() {
    Fixture fx("collision");
    fs::create_directories(fx.content / "1");
    fs::create_directories(fx.content / "2");
    auto resolver = std::make_shared<FakeNameResolver>(std::map<std::string, std::string>{{"1", "Same"}, {"2", "Same"}});
    application::ReconciliationService service(resolver, fx.settings(2));

    auto report = service.syncAll();
    assert(report.results.size() == 2);
    int created = 0;
    int conflicts = 0;
    for (const auto& r : report.results) {
        if (r.outcome == LinkOutcome::Created) created++;
        if (r.outcome == LinkOutcome::NameConflict) conflicts++;
    }
    assert(created == 1 && conflicts == 1);
    assert(fx.linkNames() == std::set<std::string>{"same"});
    std::cout << "[PASS] Colliding link names resolve to one link." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ReconciliationService Test..." << std::endl;
    testCreateLinkIsIdempotent();
    testCreateLinkFailures();
    testSymmetricDifference();
    testAllLinked();
    testEndToEnd();
    testExplicitAddRequiresContentRoot();
    testRemoveLinks();
    testPruneBroken();
    testPruneSkipsUnreadableTargets();
    testLinksRootIsFile();
    testParallelSyncKeepsOrder();
    testParallelNameCollision();
    std::cout << "[PASS] ReconciliationService Test." << std::endl;
    return 0;
}
