/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving modlink configuration (settings.json).
 *
 * Keeps JSON parsing of the settings file in one place. Values are layered:
 * built-in defaults, then the settings file, then command-line overrides.
 */

#pragma once

#include <string>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include "domain/Settings.hpp"

namespace modlink::infrastructure {

/**
 * @class ConfigError
 * @brief Settings that cannot be used: invalid values, or an explicitly requested file that is missing or unreadable.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct SettingsOverrides
 * @brief Values given on the command line; unset fields keep the loaded value.
 */
struct SettingsOverrides {
    std::optional<std::filesystem::path> contentRoot;
    std::optional<std::filesystem::path> linksRoot;
    std::optional<std::string> resolverEndpoint;
    std::optional<std::chrono::seconds> requestTimeout;
    std::optional<int> jobs;
    bool keepCase = false;
    bool verbose = false;
};

class ConfigLoader {
public:
    /// Upper bound for parallel title lookups.
    static constexpr int kMaxJobs = 64;

    /** @brief Built-in defaults (XDG data paths, Steam endpoint, 10 s timeout, serial). */
    static domain::Settings Defaults();

    /**
     * @brief Layers the keys found in a settings file over @p base.
     * @param configPath settings.json location.
     * @param base Settings to start from (usually Defaults()).
     * @param required If true, a missing or malformed file throws ConfigError;
     *        otherwise it is reported on stderr and @p base is returned.
     * @throws ConfigError on invalid values, or on unreadable files when required.
     */
    static domain::Settings Load(const std::filesystem::path& configPath, const domain::Settings& base, bool required);

    /**
     * @brief Writes @p settings to the file, preserving keys it does not own.
     * @return False if the file could not be written.
     */
    static bool Save(const std::filesystem::path& configPath, const domain::Settings& settings);

    /** @brief Applies command-line overrides, then validates. @throws ConfigError */
    static void ApplyOverrides(domain::Settings& settings, const SettingsOverrides& overrides);

    /** @brief Throws ConfigError unless 1 <= jobs <= kMaxJobs, timeout > 0 and both roots are set. */
    static void Validate(const domain::Settings& settings);
};

} // namespace modlink::infrastructure
