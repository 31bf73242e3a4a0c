/**
 * @file WorkshopNameResolver.cpp
 * @brief Implementation of the WorkshopNameResolver class.
 */
#include "infrastructure/WorkshopNameResolver.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace modlink::infrastructure {

WorkshopNameResolver::WorkshopNameResolver(const std::string& endpoint, std::chrono::seconds timeout)
    : m_client(endpoint, timeout) {}

std::optional<std::string> WorkshopNameResolver::resolve(const std::string& identifier, domain::NameCase nameCase) {
    std::optional<std::string> title;
    try {
        title = m_client.getPublishedTitle(identifier);
    } catch (const std::exception& e) {
        std::cerr << "[WorkshopNameResolver] Lookup of " << identifier << " failed: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (title && nameCase == domain::NameCase::Lower) {
        std::transform(title->begin(), title->end(), title->begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return title;
}

} // namespace modlink::infrastructure
