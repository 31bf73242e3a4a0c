#include "infrastructure/WorkshopClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace modlink::infrastructure {

using json = nlohmann::json;

WorkshopClient::WorkshopClient(const std::string& endpoint, std::chrono::seconds timeout)
    : m_timeout(timeout) {
    m_valid = splitEndpoint(endpoint, m_schemeHostPort, m_path);
    if (!m_valid) {
        std::cerr << "[WorkshopClient] Invalid endpoint: " << endpoint << std::endl;
    }
}

bool WorkshopClient::splitEndpoint(const std::string& endpoint, std::string& schemeHostPort, std::string& path) {
    auto schemeEnd = endpoint.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return false;
    }
    auto pathStart = endpoint.find('/', schemeEnd + 3);
    if (pathStart == schemeEnd + 3) {
        return false;
    }
    if (pathStart == std::string::npos) {
        if (endpoint.size() == schemeEnd + 3) return false;
        schemeHostPort = endpoint;
        path = "/";
    } else {
        schemeHostPort = endpoint.substr(0, pathStart);
        path = endpoint.substr(pathStart);
    }
    return true;
}

std::optional<std::string> WorkshopClient::getPublishedTitle(const std::string& identifier) const {
    if (!m_valid) {
        return std::nullopt;
    }

    httplib::Client cli(m_schemeHostPort);
    if (!cli.is_valid()) {
        std::cerr << "[WorkshopClient] Unsupported endpoint: " << m_schemeHostPort << std::endl;
        return std::nullopt;
    }
    cli.set_connection_timeout(static_cast<time_t>(m_timeout.count()));
    cli.set_read_timeout(static_cast<time_t>(m_timeout.count()));
    cli.set_write_timeout(static_cast<time_t>(m_timeout.count()));

    httplib::Params form = {
        {"itemcount", "1"},
        {"publishedfileids[0]", identifier}
    };

    auto res = cli.Post(m_path, form);
    if (res && res->status >= 200 && res->status < 300) {
        auto title = extractTitle(res->body);
        if (!title) {
            std::cerr << "[WorkshopClient] No title for " << identifier << std::endl;
        }
        return title;
    }

    if (res) {
        std::cerr << "[WorkshopClient] HTTP Error " << res->status << " for " << identifier << std::endl;
    } else {
        std::cerr << "[WorkshopClient] Connection failed for " << identifier << ": "
                  << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::optional<std::string> WorkshopClient::extractTitle(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (!parsed.contains("response")) {
            return std::nullopt;
        }
        const auto& response = parsed["response"];
        if (!response.is_object() || !response.contains("publishedfiledetails")) {
            return std::nullopt;
        }
        const auto& details = response["publishedfiledetails"];
        if (!details.is_array() || details.empty()) {
            return std::nullopt;
        }
        const auto& first = details[0];
        if (first.is_object() && first.contains("title") && first["title"].is_string()) {
            return first["title"].get<std::string>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[WorkshopClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace modlink::infrastructure
