#include <CLI/CLI.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/ModLinkApp.hpp"
#include "application/ReconciliationService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/WorkshopNameResolver.hpp"

using namespace modlink;

int main(int argc, char** argv) {
    CLI::App cli{"Looks up the Arma 3 Workshop for downloaded mods and creates or removes "
                 "named symbolic links to them."};
    cli.footer("Example: modlink --unlink cba_a3");

    app::Actions actions;
    std::string configPath;
    std::string contentRoot;
    std::string linksRoot;
    std::string endpoint;
    int timeoutSeconds = 0;
    int jobs = 0;
    bool keepCase = false;
    bool verbose = false;
    bool saveConfig = false;
    std::vector<std::string> addValues;

    cli.add_flag("-l,--list", actions.list, "List existing links and the directories they point to");
    auto* addOpt = cli.add_option("-a,--add", addValues, "Link the given mod ids, or every unlinked mod when no id is given")
                       ->type_name("ID")
                       ->expected(0, -1);
    cli.add_option("-u,--unlink", actions.unlinkNames, "Remove the named links")
        ->type_name("TITLE")
        ->expected(1, -1);
    cli.add_flag("-b,--broken,--prune-broken", actions.pruneBroken, "Remove links whose target no longer exists");

    cli.add_option("-c,--config", configPath, "Settings file (default: " + infrastructure::PathUtils::GetSettingsFile().string() + ")");
    cli.add_option("--content-root", contentRoot, "Directory holding the downloaded mods");
    cli.add_option("--links-root", linksRoot, "Directory receiving the named links");
    cli.add_option("--endpoint", endpoint, "GetPublishedFileDetails endpoint URL");
    cli.add_option("--timeout", timeoutSeconds, "Request timeout in seconds")->check(CLI::PositiveNumber);
    cli.add_option("-j,--jobs", jobs, "Parallel title lookups")->check(CLI::PositiveNumber);
    cli.add_flag("--keep-case", keepCase, "Keep the published title case instead of lowercasing");
    cli.add_flag("-v,--verbose", verbose, "Report every processed item");
    cli.add_flag("--save-config", saveConfig, "Write the effective settings to the settings file");

    CLI11_PARSE(cli, argc, argv);

    if (addOpt->count() > 0) {
        actions.add = true;
        for (const auto& value : addValues) {
            if (!value.empty()) {
                actions.addIdentifiers.push_back(value);
            }
        }
    }
    actions.unlink = !actions.unlinkNames.empty();

    domain::Settings settings;
    const bool explicitConfig = !configPath.empty();
    const std::filesystem::path settingsFile = explicitConfig
        ? std::filesystem::path(configPath)
        : infrastructure::PathUtils::GetSettingsFile();

    infrastructure::SettingsOverrides overrides;
    if (!contentRoot.empty()) overrides.contentRoot = contentRoot;
    if (!linksRoot.empty()) overrides.linksRoot = linksRoot;
    if (!endpoint.empty()) overrides.resolverEndpoint = endpoint;
    if (timeoutSeconds > 0) overrides.requestTimeout = std::chrono::seconds(timeoutSeconds);
    if (jobs > 0) overrides.jobs = jobs;
    overrides.keepCase = keepCase;
    overrides.verbose = verbose;

    try {
        settings = infrastructure::ConfigLoader::Load(settingsFile, infrastructure::ConfigLoader::Defaults(), explicitConfig);
        infrastructure::ConfigLoader::ApplyOverrides(settings, overrides);
    } catch (const infrastructure::ConfigError& e) {
        std::cerr << "[modlink] Configuration error: " << e.what() << std::endl;
        return 1;
    }

    if (saveConfig) {
        if (!infrastructure::ConfigLoader::Save(settingsFile, settings)) {
            return 1;
        }
        std::cout << "Settings written to " << settingsFile.string() << std::endl;
    }

    if (!actions.any()) {
        if (!saveConfig) {
            std::cout << cli.help();
        }
        return 0;
    }

    auto resolver = std::make_shared<infrastructure::WorkshopNameResolver>(settings.resolverEndpoint, settings.requestTimeout);
    auto service = std::make_unique<application::ReconciliationService>(resolver, settings);
    app::ModLinkApp runner(std::move(service));
    return runner.Run(actions);
}
