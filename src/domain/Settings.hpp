/**
 * @file Settings.hpp
 * @brief Explicit configuration passed into every component.
 */

#pragma once
#include <string>
#include <chrono>
#include <filesystem>

namespace modlink::domain {

/** @brief Steam Web API endpoint returning published file details. */
inline constexpr const char* kDefaultResolverEndpoint =
    "https://api.steampowered.com/ISteamRemoteStorage/GetPublishedFileDetails/v1/";

/**
 * @struct Settings
 * @brief Roots, resolver transport and execution knobs.
 */
struct Settings {
    std::filesystem::path contentRoot;   ///< Directory of digit-named content folders.
    std::filesystem::path linksRoot;     ///< Directory receiving the named links.
    std::string resolverEndpoint = kDefaultResolverEndpoint;
    std::chrono::seconds requestTimeout{10};
    bool lowercaseNames = true;          ///< Request lowercased names from the resolver.
    int jobs = 1;                        ///< Parallel CreateLink workers; 1 is serial.
    bool verbose = false;
};

} // namespace modlink::domain
