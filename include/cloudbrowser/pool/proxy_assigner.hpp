#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "cloudbrowser/core/config.hpp"

namespace cloudbrowser::pool {

/// Maps a pool slot to a proxy from the configured list.
///
/// round-robin: the first assignment of slot s is proxies[s % n]; every
/// later assignment of the same slot moves that slot's cursor one step.
/// random: a uniform pick on every call.
///
/// Not synchronised; the pool calls it under its own lock.
class ProxyAssigner {
public:
    ProxyAssigner(std::vector<std::string> proxies, ProxyOrdering ordering);

    /// Fixed seed for reproducible random picks.
    ProxyAssigner(std::vector<std::string> proxies, ProxyOrdering ordering,
                  std::uint32_t seed);

    /// Proxy for the next handle of the slot, or nullopt with no proxies.
    auto assign(std::size_t slot_index) -> std::optional<std::string>;

    [[nodiscard]] auto ordering() const noexcept -> ProxyOrdering { return ordering_; }
    [[nodiscard]] auto proxies() const noexcept -> const std::vector<std::string>& {
        return proxies_;
    }

private:
    std::vector<std::string> proxies_;
    ProxyOrdering ordering_;
    std::mt19937 rng_;
    std::unordered_map<std::size_t, std::size_t> cursors_;
};

} // namespace cloudbrowser::pool
