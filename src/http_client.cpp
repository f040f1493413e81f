#include "fetcher/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace fetcher {

namespace {

std::string environment(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string{value} : std::string{};
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const noexcept {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char a, unsigned char b) {
            return std::tolower(a) < std::tolower(b);
        });
}

std::optional<TransportAgent> TransportAgent::forProxy(const std::string& proxy) {
    if (proxy.empty()) {
        return std::nullopt;
    }
    TransportAgent agent;
    agent.http_proxy = proxy;
    agent.https_proxy = proxy;
    return agent;
}

std::optional<TransportAgent> TransportAgent::fromEnvironment() {
    std::string http = environment("http_proxy");
    if (http.empty()) {
        http = environment("HTTP_PROXY");
    }
    std::string https = environment("https_proxy");
    if (https.empty()) {
        https = environment("HTTPS_PROXY");
    }
    if (http.empty() && https.empty()) {
        return std::nullopt;
    }
    TransportAgent agent;
    agent.http_proxy = std::move(http);
    agent.https_proxy = std::move(https);
    return agent;
}

std::optional<TransportAgent> mergeAgents(const std::optional<TransportAgent>& defaults,
                                          const std::optional<TransportAgent>& instance,
                                          bool disable) {
    if (disable) {
        return std::nullopt;
    }
    if (!defaults) {
        return instance;
    }
    if (!instance) {
        return defaults;
    }
    TransportAgent merged = *defaults;
    if (!instance->http_proxy.empty()) {
        merged.http_proxy = instance->http_proxy;
    }
    if (!instance->https_proxy.empty()) {
        merged.https_proxy = instance->https_proxy;
    }
    merged.keep_alive = instance->keep_alive;
    return merged;
}

} // namespace fetcher
