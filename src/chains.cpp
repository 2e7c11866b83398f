#include "xlend/chains.hpp"

namespace xlend {

const std::vector<ChainInfo>& known_chains() {
    static const std::vector<ChainInfo> chains = {
        {"ethereum", 1, false},
        {"sepolia", 11155111, true},
        {"polygon", 137, false},
        {"amoy", 80002, true},
        {"arbitrum", 42161, false},
        {"arbitrum-sepolia", 421614, true},
        {"base", 8453, false},
        {"base-sepolia", 84532, true},
        {"optimism", 10, false},
        {"optimism-sepolia", 11155420, true},
        {"avalanche", 43114, false},
    };
    return chains;
}

std::optional<std::string> chain_name(ChainId id) {
    for (const auto& c : known_chains()) {
        if (c.id == id) return std::string(c.name);
    }
    return std::nullopt;
}

std::optional<ChainId> chain_id(std::string_view name) {
    for (const auto& c : known_chains()) {
        if (c.name == name) return c.id;
    }
    return std::nullopt;
}

} // namespace xlend
