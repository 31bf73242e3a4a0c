/**
 * @file WorkshopClient.hpp
 * @brief Low-level HTTP client for the Steam Workshop published-file details API.
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include "domain/Settings.hpp"

namespace modlink::infrastructure {

class WorkshopClient {
public:
    WorkshopClient(const std::string& endpoint = domain::kDefaultResolverEndpoint,
                   std::chrono::seconds timeout = std::chrono::seconds(10));

    /** @brief Sends one POST (itemcount=1, publishedfileids[0]=id) and returns the item title. */
    std::optional<std::string> getPublishedTitle(const std::string& identifier) const;

    /** @brief Reads response.publishedfiledetails[0].title from a response body. */
    static std::optional<std::string> extractTitle(const std::string& body);

    /**
     * @brief Splits "https://host[:port]/path" into "https://host[:port]" and "/path".
     * @return False if the endpoint has no scheme or host.
     */
    static bool splitEndpoint(const std::string& endpoint, std::string& schemeHostPort, std::string& path);

private:
    std::string m_schemeHostPort;
    std::string m_path;
    std::chrono::seconds m_timeout;
    bool m_valid;
};

} // namespace modlink::infrastructure
