#ifndef XLEND_ENGINE_HPP
#define XLEND_ENGINE_HPP

#include <memory>
#include <mutex>
#include <vector>

#include "types.hpp"
#include "access.hpp"
#include "bridge_manager.hpp"
#include "compliance.hpp"
#include "config.hpp"
#include "events.hpp"
#include "interest.hpp"
#include "ledger.hpp"
#include "liquidity.hpp"
#include "oracle.hpp"
#include "router.hpp"
#include "vault.hpp"

namespace xlend {

// =============================================================================
// Engine - one chain's lending deployment wired from a Config
//
// Owns every component. Registers the loopback adapter for this chain and,
// when a relayer URL is configured, the CCIP, Axelar and relay adapters over
// HTTP. Router sources are added in order: local vault, cross-chain bridge,
// then any external money markets.
// =============================================================================

class Engine {
public:
    Engine(const Config& config, const Address& owner, Clock clock = system_clock());
    ~Engine() = default;

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Address the local vault and bridge source act under
    static constexpr Address VAULT_ADDRESS = make_address(0x7856a017);

    // Adds an external money market as the next router source
    size_t add_money_market(std::shared_ptr<IMoneyMarket> market);

    // Receives every event after the engine's own log
    void subscribe(EventSink sink);

    const Config& config() const { return config_; }

    AccessControl& access() { return *access_; }
    PriceOracle& oracle() { return *oracle_; }
    AllowListGate& compliance() { return *compliance_; }
    CollateralLedger& ledger() { return *ledger_; }
    BridgeManager& bridge() { return *bridge_; }
    LiquidityRouter& router() { return *router_; }
    Vault& vault() { return *vault_; }
    LocalVaultSource& local_source() { return *local_source_; }
    CrossChainBridgeSource& bridge_source() { return *bridge_source_; }
    const EventLog& events() const { return events_; }

private:
    void publish(const Event& event);
    void register_adapters(const Address& owner);

    Config config_;
    Clock clock_;
    EventLog events_;
    std::vector<EventSink> subscribers_;
    std::mutex subscribers_mutex_;

    std::unique_ptr<AccessControl> access_;
    std::unique_ptr<PriceOracle> oracle_;
    std::unique_ptr<AllowListGate> compliance_;
    InterestRateModel rate_model_;
    std::unique_ptr<CollateralLedger> ledger_;
    std::unique_ptr<BridgeManager> bridge_;
    std::unique_ptr<LiquidityRouter> router_;
    std::shared_ptr<LocalVaultSource> local_source_;
    std::shared_ptr<CrossChainBridgeSource> bridge_source_;
    std::unique_ptr<Vault> vault_;
};

} // namespace xlend

#endif // XLEND_ENGINE_HPP
