/**
 * @file WorkshopNameResolver.hpp
 * @brief Adapter resolving Workshop item ids to titles.
 */

#pragma once
#include "domain/NameResolver.hpp"
#include "infrastructure/WorkshopClient.hpp"
#include <string>
#include <chrono>

namespace modlink::infrastructure {

/**
 * @class WorkshopNameResolver
 * @brief Implements NameResolver using the Steam Web API.
 */
class WorkshopNameResolver : public domain::NameResolver {
public:
    /**
     * @param endpoint GetPublishedFileDetails URL.
     * @param timeout Bound for connect, write and read of each request.
     */
    WorkshopNameResolver(const std::string& endpoint, std::chrono::seconds timeout);

    /** @brief One request per call, never throws. @see domain::NameResolver::resolve */
    std::optional<std::string> resolve(const std::string& identifier, domain::NameCase nameCase = domain::NameCase::Lower) override;

private:
    WorkshopClient m_client;
};

} // namespace modlink::infrastructure
