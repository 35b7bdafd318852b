#include "settle/engine/escrow_service.hpp"

#include "settle/codec/json_codec.hpp"
#include "settle/domain/errors.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <utility>
#include <vector>

namespace settle {

using nlohmann::json;

namespace {

// Rejects negative and out-of-range numbers, which nlohmann would otherwise
// wrap or truncate.
template <typename T>
T unsignedField(const json& request, const char* key) {
  const json& value = request.at(key);
  if (!value.is_number_unsigned()) {
    throw ValidationError(std::string(key) + " must be a non-negative integer");
  }
  if (value.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
    throw ValidationError(std::string(key) + " is out of range");
  }
  return value.get<T>();
}

domain::SettlementId settlementIdOf(const json& request) {
  return unsignedField<domain::SettlementId>(request, "settlement_id");
}

json errorResponse(const char* name, const std::string& message) {
  return json{{"status", "error"}, {"error", name}, {"message", message}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
EscrowService::EscrowService(domain::EscrowConfig config,
                             const ITimeProvider& clock,
                             const IPriceGuard* price_guard,
                             ISettlementStore* store)
    : config_(config),
      engine_(std::move(config), clock, bus_, price_guard, store) {
  registerHandlers();
}

EscrowService::~EscrowService() { stop(); }

// -----------------------------------------------------------------------------
// start(): IPC server and telemetry bridge
// -----------------------------------------------------------------------------
void EscrowService::start() {
  if (running_) {
    return;
  }

  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_shared<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    ipc_server_->start();

    // A publish already past the bus snapshot may still run this after
    // stop(); the weak reference keeps the server alive for that call only.
    std::weak_ptr<IpcServer> server = ipc_server_;
    telemetry_subscription_ = bus_.subscribe([server](const Event& e) {
      if (auto live = server.lock()) {
        live->pushTelemetry(e);
      }
    });
  }

  running_ = true;
  std::cout << "[EscrowService] started"
            << (ipc_server_ ? " with IPC" : " without IPC") << ".\n";
}

// -----------------------------------------------------------------------------
// stop(): worker first, then the bridge, then the server
// -----------------------------------------------------------------------------
void EscrowService::stop() {
  if (!running_) {
    return;
  }

  if (ipc_server_) {
    ipc_server_->stop();
  }
  if (telemetry_subscription_.has_value()) {
    bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  running_ = false;
  std::cout << "[EscrowService] stopped.\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, map errors
// -----------------------------------------------------------------------------
std::string EscrowService::executeCommand(const std::string& cmd) {
  json response;
  std::string op;

  try {
    json request = json::parse(cmd);
    if (!request.is_object()) {
      throw ValidationError("Command must be a JSON object");
    }
    op = request.at("op").get<std::string>();
    std::string caller = request.value("caller", std::string{});

    auto it = handlers_.find(op);
    if (it == handlers_.end()) {
      throw ValidationError("Unknown op: " + op);
    }

    response = it->second(request, caller);
    response["status"] = "ok";
  } catch (const SettlementError& e) {
    response = errorResponse(errorCodeName(e.code()), e.what());
    std::cerr << "[EscrowService] " << (op.empty() ? "command" : op)
              << " rejected: " << errorCodeName(e.code()) << ": " << e.what()
              << "\n";
  } catch (const json::exception& e) {
    response = errorResponse(errorCodeName(ErrorCode::Validation),
                             std::string("Malformed command: ") + e.what());
    std::cerr << "[EscrowService] malformed command: " << e.what() << "\n";
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// registerHandlers(): one entry per op
// -----------------------------------------------------------------------------
void EscrowService::registerHandlers() {
  // --- Lifecycle -------------------------------------------------------------
  handlers_["create"] = [this](const json& req, const std::string& caller) {
    auto transfers = req.at("transfers").get<std::vector<domain::Transfer>>();
    auto timeout_ms = req.value("timeout_ms", std::int64_t{0});
    auto requires_price = req.value("requires_price", false);
    auto id = engine_.create(caller, std::move(transfers), timeout_ms,
                             requires_price);
    return json{{"settlement_id", id}};
  };

  handlers_["deposit"] = [this](const json& req, const std::string& caller) {
    auto total = engine_.deposit(caller, settlementIdOf(req),
                                 unsignedField<domain::Amount>(req, "amount"));
    return json{{"total_deposited", total}};
  };

  handlers_["initiate"] = [this](const json& req, const std::string& caller) {
    auto position = engine_.initiate(caller, settlementIdOf(req));
    return json{{"queue_position", position}};
  };

  handlers_["execute"] = [this](const json& req, const std::string& caller) {
    auto id = settlementIdOf(req);
    auto executed =
        engine_.execute(caller, id, unsignedField<std::uint32_t>(req, "count"));
    auto s = engine_.getSettlement(id);
    return json{{"executed", executed},
                {"executed_transfers", s.executed_transfers},
                {"state", domain::settlementStateToString(s.state)}};
  };

  handlers_["refund"] = [this](const json& req, const std::string& caller) {
    auto refunds = engine_.refund(caller, settlementIdOf(req));
    return json{{"refunds", refunds}};
  };

  handlers_["dispute"] = [this](const json& req, const std::string& caller) {
    auto previous = engine_.dispute(caller, settlementIdOf(req),
                                    req.at("reason").get<std::string>());
    return json{{"previous_state", domain::settlementStateToString(previous)}};
  };

  handlers_["resolve_dispute"] = [this](const json& req,
                                        const std::string& caller) {
    auto name = req.at("outcome").get<std::string>();
    auto outcome = domain::disputeOutcomeFromString(name);
    if (!outcome) {
      throw ValidationError("Unknown dispute outcome: " + name);
    }
    auto state = engine_.resolveDispute(caller, settlementIdOf(req), *outcome);
    return json{{"state", domain::settlementStateToString(state)}};
  };

  // --- Administration --------------------------------------------------------
  handlers_["pause"] = [this](const json&, const std::string& caller) {
    return json{{"changed", engine_.pause(caller)}, {"paused", true}};
  };

  handlers_["unpause"] = [this](const json&, const std::string& caller) {
    return json{{"changed", engine_.unpause(caller)}, {"paused", false}};
  };

  handlers_["set_manual_price"] = [this](const json& req,
                                         const std::string& caller) {
    std::optional<domain::Price> price;
    const json& value = req.at("price");
    if (!value.is_null()) {
      price = value.get<domain::Price>();
    }
    auto previous = engine_.setManualPrice(caller, settlementIdOf(req), price);
    return json{{"previous", previous ? json(*previous) : json(nullptr)}};
  };

  handlers_["add_disputer"] = [this](const json& req, const std::string& caller) {
    return json{{"changed", engine_.addDisputer(
                                caller, req.at("address").get<std::string>())}};
  };

  handlers_["remove_disputer"] = [this](const json& req,
                                        const std::string& caller) {
    return json{{"changed", engine_.removeDisputer(
                                caller, req.at("address").get<std::string>())}};
  };

  // --- Queries ---------------------------------------------------------------
  handlers_["get_settlement"] = [this](const json& req, const std::string&) {
    return json{{"settlement", engine_.getSettlement(settlementIdOf(req))}};
  };

  handlers_["get_details"] = [this](const json& req, const std::string&) {
    auto d = engine_.getSettlementDetails(settlementIdOf(req));
    return json{{"settlement", d.settlement},
                {"contributions", d.contributions},
                {"escrow_balance", d.escrow_balance},
                {"released", d.released},
                {"is_queue_head", d.is_queue_head}};
  };

  handlers_["can_initiate"] = [this](const json& req, const std::string&) {
    auto check = engine_.canInitiate(settlementIdOf(req));
    return json{{"ok", check.ok}, {"reason", check.reason}};
  };

  handlers_["is_eligible_for_refund"] = [this](const json& req,
                                               const std::string&) {
    return json{{"eligible", engine_.isEligibleForRefund(settlementIdOf(req))}};
  };

  handlers_["queue_head"] = [this](const json&, const std::string&) {
    auto head = engine_.queueHead();
    return json{{"head", head ? json(*head) : json(nullptr)}};
  };

  handlers_["queue_length"] = [this](const json&, const std::string&) {
    return json{{"length", engine_.queueLength()}};
  };

  handlers_["next_settlement_id"] = [this](const json&, const std::string&) {
    return json{{"next_settlement_id", engine_.nextSettlementId()}};
  };

  handlers_["balance_of"] = [this](const json& req, const std::string&) {
    return json{
        {"balance", engine_.balanceOf(req.at("address").get<std::string>())}};
  };

  handlers_["check_invariants"] = [this](const json&, const std::string&) {
    auto report = engine_.checkInvariants();
    return json{{"holds", report.holds}, {"violations", report.violations}};
  };

  handlers_["ping"] = [](const json&, const std::string&) {
    return json{{"response", "PONG"}};
  };
}

}  // namespace settle
