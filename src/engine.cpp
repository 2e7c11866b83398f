#include "xlend/engine.hpp"
#include "xlend/adapters/axelar.hpp"
#include "xlend/adapters/ccip.hpp"
#include "xlend/adapters/local.hpp"
#include "xlend/adapters/relay.hpp"
#include "xlend/http_transport.hpp"
#include "xlend/log.hpp"

namespace xlend {

namespace {
constexpr std::string_view COMPONENT = "engine";
}

Engine::Engine(const Config& config, const Address& owner, Clock clock)
    : config_(config), clock_(std::move(clock)), rate_model_(config.rate_model) {
    config_.validate();
    log::set_level(parse_log_level(config_.log_level));

    EventSink sink = [this](const Event& e) { publish(e); };

    access_ = std::make_unique<AccessControl>(owner);
    oracle_ = std::make_unique<PriceOracle>(clock_);
    compliance_ = std::make_unique<AllowListGate>();
    ledger_ = std::make_unique<CollateralLedger>(*oracle_, rate_model_, config_.vault, clock_);
    bridge_ = std::make_unique<BridgeManager>(*access_, sink);
    router_ = std::make_unique<LiquidityRouter>(config_.router, clock_);

    local_source_ = std::make_shared<LocalVaultSource>(*ledger_, VAULT_ADDRESS, config_.chain.id);
    bridge_source_ = std::make_shared<CrossChainBridgeSource>(
        *bridge_, *access_, VAULT_ADDRESS, config_.chain.id, BridgeSourceParams{}, clock_, sink);
    router_->add_source(local_source_);
    router_->add_source(bridge_source_);

    vault_ = std::make_unique<Vault>(*ledger_, *router_, *access_, compliance_.get(), config_.vault, sink);

    for (const auto& asset : config_.assets) {
        int32_t rc = vault_->register_asset(owner, asset.asset, asset.collateral_factor_bps);
        if (rc != errors::OK) {
            throw ConfigError("Cannot register asset " + asset.symbol + ": " + errors::name(rc));
        }
    }

    register_adapters(owner);
    log::info(COMPONENT, "started on ", config_.chain.name, " (", config_.chain.id, ") with ",
              config_.assets.size(), " assets");
}

void Engine::register_adapters(const Address& owner) {
    std::vector<std::shared_ptr<BridgeAdapter>> adapters;
    adapters.push_back(std::make_shared<LocalAdapter>(config_.chain.name));

    if (config_.bridge.relayer_url) {
        auto transport = std::make_shared<HttpRelayTransport>(*config_.bridge.relayer_url);
        RetryPolicy retry = RetryPolicy::from(config_.bridge);
        adapters.push_back(std::make_shared<CcipAdapter>(transport, retry));
        adapters.push_back(std::make_shared<AxelarAdapter>(transport, retry));
        adapters.push_back(std::make_shared<RelayAdapter>(transport, config_.chain.id, retry));
    }

    for (auto& adapter : adapters) {
        std::string name(adapter->protocol_name());
        int32_t rc = bridge_->register_adapter(owner, std::move(adapter));
        if (rc != errors::OK) {
            throw ConfigError("Cannot register adapter " + name + ": " + errors::name(rc));
        }
    }
}

size_t Engine::add_money_market(std::shared_ptr<IMoneyMarket> market) {
    return router_->add_source(std::make_shared<ExternalMoneyMarketSource>(std::move(market), config_.chain.id));
}

void Engine::subscribe(EventSink sink) {
    std::lock_guard lock(subscribers_mutex_);
    subscribers_.push_back(std::move(sink));
}

void Engine::publish(const Event& event) {
    events_.sink()(event);

    std::vector<EventSink> subscribers;
    {
        std::lock_guard lock(subscribers_mutex_);
        subscribers = subscribers_;
    }
    for (const auto& s : subscribers) {
        if (s) s(event);
    }
}

} // namespace xlend
