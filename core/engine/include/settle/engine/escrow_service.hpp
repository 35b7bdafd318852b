#pragma once

#include "settle/domain/escrow_config.hpp"
#include "settle/engine/settlement_engine.hpp"
#include "settle/eventbus/event_bus.hpp"
#include "settle/network/ipc_server.hpp"
#include "settle/persistence/i_settlement_store.hpp"
#include "settle/price/i_price_guard.hpp"
#include "settle/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace settle {

// -----------------------------------------------------------------------------
// EscrowService
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the escrow daemon. Owns the EventBus and the
//         SettlementEngine and exposes every engine operation as a JSON
//         command.
//
// @details
// Lifecycle:
//   constructor  builds the engine (loading the store, if any). No sockets.
//   start()      if both IPC endpoints in the config are non-empty, starts
//                the IpcServer and bridges every EventBus notification to
//                its telemetry queue.
//   stop()       stops the IpcServer worker, then removes the bridge.
//                Idempotent.
//
// Commands (executeCommand):
//   Request  {"op": "<name>", "caller": "<address>", ...op fields}
//   Success  {"status": "ok", ...op result}
//   Failure  {"status": "error", "error": "<ErrorName>", "message": "..."}
// <ErrorName> is errorCodeName() of the SettlementError, or ValidationError
// for malformed JSON, missing fields and unknown ops.
//
// Thread model:
//   executeCommand() is safe from any thread (the engine serializes). In the
//   daemon it runs on the IPC worker thread.
//
// Ownership:
//   EscrowService
//    ├── bus_          (EventBus, value member)
//    ├── engine_       (SettlementEngine, value member)
//    └── ipc_server_   (shared_ptr<IpcServer>, stopped first; the telemetry
//                       bridge holds only a weak reference)
//   The clock, price guard and store are non-owning and must outlive it.
// -----------------------------------------------------------------------------
class EscrowService {
 public:
  EscrowService(domain::EscrowConfig config, const ITimeProvider& clock,
                const IPriceGuard* price_guard = nullptr,
                ISettlementStore* store = nullptr);

  ~EscrowService();

  EscrowService(const EscrowService&) = delete;
  EscrowService& operator=(const EscrowService&) = delete;
  EscrowService(EscrowService&&) = delete;
  EscrowService& operator=(EscrowService&&) = delete;

  void start();
  void stop();
  bool isRunning() const { return running_; }

  // Parses and dispatches one JSON command. Never throws for bad input;
  // every failure becomes an error response.
  std::string executeCommand(const std::string& cmd);

  SettlementEngine& engine() { return engine_; }
  EventBus& eventBus() { return bus_; }

 private:
  using Handler = std::function<nlohmann::json(const nlohmann::json& request,
                                               const std::string& caller)>;

  void registerHandlers();

  domain::EscrowConfig config_;
  EventBus bus_;
  SettlementEngine engine_;

  std::unordered_map<std::string, Handler> handlers_;

  std::shared_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  bool running_{false};
};

}  // namespace settle
