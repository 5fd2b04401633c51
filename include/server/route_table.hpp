#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bwproxy {

enum class RouteKind {
    HEALTH,     // liveness of the sidecar itself
    SYNC,       // POST triggers bw sync
    PROXY       // passthrough to bw serve
};

/**
 * @brief Immutable path -> handler mapping
 *
 * Built once, read concurrently by every request thread. Paths match exactly;
 * anything not listed is proxied.
 */
class RouteTable {
public:
    explicit RouteTable(std::vector<std::pair<std::string, RouteKind>> routes) {
        for (auto& [path, kind] : routes) {
            routes_.emplace(std::move(path), kind);
        }
    }

    [[nodiscard]] RouteKind resolve(std::string_view path) const {
        const auto it = routes_.find(std::string(path));
        return it != routes_.end() ? it->second : RouteKind::PROXY;
    }

    [[nodiscard]] size_t size() const { return routes_.size(); }

private:
    std::unordered_map<std::string, RouteKind> routes_;
};

} // namespace bwproxy
