/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

namespace modlink::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kContentRootKey = "content_root";
constexpr const char* kLinksRootKey = "links_root";
constexpr const char* kEndpointKey = "resolver_endpoint";
constexpr const char* kTimeoutKey = "request_timeout_seconds";
constexpr const char* kLowercaseKey = "lowercase_names";
constexpr const char* kJobsKey = "jobs";

void ApplyJson(const nlohmann::json& j, domain::Settings& settings) {
    if (!j.is_object()) {
        throw ConfigError("settings root must be a JSON object");
    }
    if (j.contains(kContentRootKey)) {
        settings.contentRoot = j.at(kContentRootKey).get<std::string>();
    }
    if (j.contains(kLinksRootKey)) {
        settings.linksRoot = j.at(kLinksRootKey).get<std::string>();
    }
    if (j.contains(kEndpointKey)) {
        settings.resolverEndpoint = j.at(kEndpointKey).get<std::string>();
    }
    if (j.contains(kTimeoutKey)) {
        settings.requestTimeout = std::chrono::seconds(j.at(kTimeoutKey).get<long long>());
    }
    if (j.contains(kLowercaseKey)) {
        settings.lowercaseNames = j.at(kLowercaseKey).get<bool>();
    }
    if (j.contains(kJobsKey)) {
        settings.jobs = j.at(kJobsKey).get<int>();
    }
}

} // namespace

domain::Settings ConfigLoader::Defaults() {
    domain::Settings settings;
    settings.contentRoot = PathUtils::GetDefaultContentRoot();
    settings.linksRoot = PathUtils::GetDefaultLinksRoot();
    return settings;
}

domain::Settings ConfigLoader::Load(const fs::path& configPath, const domain::Settings& base, bool required) {
    domain::Settings settings = base;

    std::error_code ec;
    if (!fs::exists(configPath, ec)) {
        if (required) {
            throw ConfigError("settings file not found: " + configPath.string());
        }
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        if (!f) {
            throw ConfigError("cannot open " + configPath.string());
        }
        f >> j;
    } catch (const std::exception& e) {
        if (required) {
            throw ConfigError("error reading " + configPath.string() + ": " + e.what());
        }
        std::cerr << "[ConfigLoader] Error reading " << configPath.string() << ": " << e.what()
                  << " (using defaults)" << std::endl;
        return settings;
    }

    try {
        ApplyJson(j, settings);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("invalid value in " + configPath.string() + ": " + e.what());
    }

    Validate(settings);
    return settings;
}

bool ConfigLoader::Save(const fs::path& configPath, const domain::Settings& settings) {
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    std::error_code ec;
    if (fs::exists(configPath, ec)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) {
                j = nlohmann::json::object();
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Replacing unreadable " << configPath.string() << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j[kContentRootKey] = settings.contentRoot.string();
    j[kLinksRootKey] = settings.linksRoot.string();
    j[kEndpointKey] = settings.resolverEndpoint;
    j[kTimeoutKey] = settings.requestTimeout.count();
    j[kLowercaseKey] = settings.lowercaseNames;
    j[kJobsKey] = settings.jobs;

    if (configPath.has_parent_path()) {
        fs::create_directories(configPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[ConfigLoader] Cannot create " << configPath.parent_path().string() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing " << configPath.string() << std::endl;
        return false;
    }
    f << j.dump(4) << "\n";
    return static_cast<bool>(f);
}

void ConfigLoader::ApplyOverrides(domain::Settings& settings, const SettingsOverrides& overrides) {
    if (overrides.contentRoot) settings.contentRoot = *overrides.contentRoot;
    if (overrides.linksRoot) settings.linksRoot = *overrides.linksRoot;
    if (overrides.resolverEndpoint) settings.resolverEndpoint = *overrides.resolverEndpoint;
    if (overrides.requestTimeout) settings.requestTimeout = *overrides.requestTimeout;
    if (overrides.jobs) settings.jobs = *overrides.jobs;
    if (overrides.keepCase) settings.lowercaseNames = false;
    settings.verbose = overrides.verbose;
    Validate(settings);
}

void ConfigLoader::Validate(const domain::Settings& settings) {
    if (settings.contentRoot.empty()) {
        throw ConfigError("content root must not be empty");
    }
    if (settings.linksRoot.empty()) {
        throw ConfigError("links root must not be empty");
    }
    if (settings.requestTimeout.count() <= 0) {
        throw ConfigError("request timeout must be positive");
    }
    if (settings.jobs < 1 || settings.jobs > kMaxJobs) {
        throw ConfigError("jobs must be between 1 and " + std::to_string(kMaxJobs));
    }
}

} // namespace modlink::infrastructure
