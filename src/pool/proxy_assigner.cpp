#include "cloudbrowser/pool/proxy_assigner.hpp"

namespace cloudbrowser::pool {

ProxyAssigner::ProxyAssigner(std::vector<std::string> proxies, ProxyOrdering ordering)
    : ProxyAssigner(std::move(proxies), ordering, std::random_device{}()) {}

ProxyAssigner::ProxyAssigner(std::vector<std::string> proxies, ProxyOrdering ordering,
                             std::uint32_t seed)
    : proxies_(std::move(proxies)), ordering_(ordering), rng_(seed) {}

auto ProxyAssigner::assign(std::size_t slot_index) -> std::optional<std::string> {
    if (proxies_.empty()) return std::nullopt;

    if (ordering_ == ProxyOrdering::Random) {
        std::uniform_int_distribution<std::size_t> dist(0, proxies_.size() - 1);
        return proxies_[dist(rng_)];
    }

    auto [it, first] = cursors_.try_emplace(slot_index, slot_index % proxies_.size());
    if (!first) {
        it->second = (it->second + 1) % proxies_.size();
    }
    return proxies_[it->second];
}

} // namespace cloudbrowser::pool
