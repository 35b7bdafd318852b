// -----------------------------------------------------------------------------
// settlement_escrowd: escrow settlement daemon.
//
// Usage: settlement_escrowd [config.json]
//
//   1) Load EscrowConfig (defaults when no path is given).
//   2) Open the JSON snapshot store and build the EscrowService, which
//      restores every settlement, escrow account and the queue.
//   3) Log every committed notification to stdout.
//   4) Start the IPC server (JSON commands on REP, telemetry on PUB).
//   5) Run the PriceFeedGateway on the main thread; each tick updates the
//      FeedPriceGuard consulted by initiate().
//   6) On SIGINT/SIGTERM stop the gateway, then the service.
//
// Thread layout:
//   main thread   PriceFeedGateway::run() (ZMQ SUB recv loop)
//   ipc thread    IpcServer: commands -> SettlementEngine, telemetry out
// -----------------------------------------------------------------------------

#include "settle/codec/json_codec.hpp"
#include "settle/config/config_loader.hpp"
#include "settle/domain/errors.hpp"
#include "settle/domain/escrow_config.hpp"
#include "settle/engine/escrow_service.hpp"
#include "settle/persistence/json_file_store.hpp"
#include "settle/price/feed_price_guard.hpp"
#include "settle/price/price_feed_gateway.hpp"
#include "settle/time/live_time_provider.hpp"

#include <csignal>
#include <exception>
#include <iostream>

// Set once before signals are installed; read by the handler only.
static settle::PriceFeedGateway* g_gateway_ptr = nullptr;

// stop() is a pair of atomic stores.
static void shutdown_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

int main(int argc, char** argv) {
  settle::domain::EscrowConfig config;
  try {
    if (argc > 1) {
      config = settle::loadConfig(argv[1]);
    }
  } catch (const settle::SettlementError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  settle::LiveTimeProvider clock;
  settle::FeedPriceGuard price_guard;
  settle::JsonFileStore store(config.snapshot_path);

  try {
    settle::EscrowService service(config, clock, &price_guard, &store);

    service.eventBus().subscribe([](const settle::Event& e) {
      std::cout << "[Event] " << settle::eventToJson(e).dump() << "\n";
    });

    service.start();

    settle::PriceFeedGateway gateway(
        [&price_guard](const settle::domain::SecuredPrice& tick) {
          price_guard.update(tick);
        },
        config.price_feed_endpoint);

    g_gateway_ptr = &gateway;
    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    std::cout << "[main] price feed " << config.price_feed_endpoint
              << ", snapshot " << config.snapshot_path
              << ". Press Ctrl-C to stop.\n";
    gateway.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_gateway_ptr = nullptr;

    std::cout << "[main] shutting down...\n";
    service.stop();
  } catch (const settle::StorageError& e) {
    std::cerr << "[main] storage failure: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] done.\n";
  return 0;
}
