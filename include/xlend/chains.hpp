#ifndef XLEND_CHAINS_HPP
#define XLEND_CHAINS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace xlend {

// =============================================================================
// Well-known chains: canonical name <-> EVM chain id
//
// Canonical names are what BridgeManager and the adapters key on; each
// adapter translates them to its own protocol selector.
// =============================================================================

struct ChainInfo {
    std::string_view name;
    ChainId id;
    bool testnet;
};

const std::vector<ChainInfo>& known_chains();

std::optional<std::string> chain_name(ChainId id);
std::optional<ChainId> chain_id(std::string_view name);

} // namespace xlend

#endif // XLEND_CHAINS_HPP
