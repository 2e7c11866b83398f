#ifndef XLEND_HPP
#define XLEND_HPP

#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "events.hpp"
#include "interest.hpp"
#include "oracle.hpp"
#include "compliance.hpp"
#include "access.hpp"
#include "chains.hpp"
#include "ledger.hpp"
#include "bridge_adapter.hpp"
#include "bridge_manager.hpp"
#include "http_transport.hpp"
#include "adapters/local.hpp"
#include "adapters/ccip.hpp"
#include "adapters/axelar.hpp"
#include "adapters/relay.hpp"
#include "adapters/money_market.hpp"
#include "liquidity.hpp"
#include "router.hpp"
#include "vault.hpp"
#include "engine.hpp"

#endif // XLEND_HPP
