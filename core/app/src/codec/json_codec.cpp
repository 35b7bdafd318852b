#include "settle/codec/json_codec.hpp"

#include "settle/domain/errors.hpp"
#include "settle/events/event_types.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace settle {

using nlohmann::json;

namespace {

json stateToJson(domain::SettlementState state) {
  return domain::settlementStateToString(state);
}

domain::SettlementState stateFromJson(const json& j) {
  auto name = j.get<std::string>();
  auto state = domain::settlementStateFromString(name);
  if (!state) {
    throw ValidationError("Unknown settlement state: " + name);
  }
  return *state;
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

}  // namespace

namespace domain {

// -----------------------------------------------------------------------------
// Transfer / Contribution
// -----------------------------------------------------------------------------
void to_json(json& j, const Transfer& t) {
  j = json{{"from", t.from},
           {"to", t.to},
           {"amount", t.amount},
           {"executed", t.executed}};
}

void from_json(const json& j, Transfer& t) {
  j.at("from").get_to(t.from);
  j.at("to").get_to(t.to);
  if (!j.at("amount").is_number_unsigned()) {
    throw ValidationError("Transfer amount must be a non-negative integer");
  }
  j.at("amount").get_to(t.amount);
  t.executed = j.value("executed", false);
}

void to_json(json& j, const Contribution& c) {
  j = json{{"party", c.party}, {"amount", c.amount}};
}

void from_json(const json& j, Contribution& c) {
  j.at("party").get_to(c.party);
  j.at("amount").get_to(c.amount);
}

// -----------------------------------------------------------------------------
// Settlement
// -----------------------------------------------------------------------------
void to_json(json& j, const Settlement& s) {
  j = json{{"id", s.id},
           {"initiator", s.initiator},
           {"total_amount", s.total_amount},
           {"total_deposited", s.total_deposited},
           {"state", stateToJson(s.state)},
           {"created_at_ms", s.created_at_ms},
           {"timeout_ms", s.timeout_ms},
           {"deadline_ms", s.deadline_ms()},
           {"queue_position", optionalToJson(s.queue_position)},
           {"total_transfers", s.total_transfers},
           {"executed_transfers", s.executed_transfers},
           {"requires_price", s.requires_price},
           {"locked_price", optionalToJson(s.locked_price)},
           {"manual_price", optionalToJson(s.manual_price)},
           {"initiated_at_ms", s.initiated_at_ms},
           {"finalized_at_ms", s.finalized_at_ms},
           {"dispute_reason", s.dispute_reason},
           {"disputed_by", s.disputed_by},
           {"transfers", s.transfers}};
  j["state_before_dispute"] =
      s.state_before_dispute ? stateToJson(*s.state_before_dispute)
                             : json(nullptr);
}

void from_json(const json& j, Settlement& s) {
  j.at("id").get_to(s.id);
  j.at("initiator").get_to(s.initiator);
  j.at("total_amount").get_to(s.total_amount);
  j.at("total_deposited").get_to(s.total_deposited);
  s.state = stateFromJson(j.at("state"));
  j.at("created_at_ms").get_to(s.created_at_ms);
  j.at("timeout_ms").get_to(s.timeout_ms);
  s.queue_position = optionalFromJson<std::uint64_t>(j, "queue_position");
  j.at("total_transfers").get_to(s.total_transfers);
  j.at("executed_transfers").get_to(s.executed_transfers);
  s.requires_price = j.value("requires_price", false);
  s.locked_price = optionalFromJson<Price>(j, "locked_price");
  s.manual_price = optionalFromJson<Price>(j, "manual_price");
  s.initiated_at_ms = j.value("initiated_at_ms", std::int64_t{0});
  s.finalized_at_ms = j.value("finalized_at_ms", std::int64_t{0});
  s.dispute_reason = j.value("dispute_reason", std::string{});
  s.disputed_by = j.value("disputed_by", std::string{});

  auto before = j.find("state_before_dispute");
  if (before != j.end() && !before->is_null()) {
    s.state_before_dispute = stateFromJson(*before);
  } else {
    s.state_before_dispute.reset();
  }

  j.at("transfers").get_to(s.transfers);
}

// -----------------------------------------------------------------------------
// EscrowAccount / SecuredPrice
// -----------------------------------------------------------------------------
void to_json(json& j, const EscrowAccount& a) {
  j = json{{"total_amount", a.total_amount},
           {"deposited", a.deposited},
           {"released", a.released},
           {"closed", a.closed},
           {"contributions", a.contributions}};
}

void from_json(const json& j, EscrowAccount& a) {
  j.at("total_amount").get_to(a.total_amount);
  j.at("deposited").get_to(a.deposited);
  j.at("released").get_to(a.released);
  j.at("closed").get_to(a.closed);
  j.at("contributions").get_to(a.contributions);
}

void to_json(json& j, const SecuredPrice& p) {
  j = json{{"price", p.price},
           {"twap", p.twap},
           {"confidence", p.confidence_score},
           {"is_secure", p.is_secure},
           {"timestamp_ms", p.timestamp_ms}};
}

}  // namespace domain

// -----------------------------------------------------------------------------
// EngineSnapshot
// -----------------------------------------------------------------------------
// Map keys are settlement ids / addresses; accounts are written as an array
// of objects so numeric ids stay numbers.
void to_json(json& j, const EngineSnapshot& s) {
  json accounts = json::array();
  for (const auto& [id, account] : s.accounts) {
    json entry = account;
    entry["settlement_id"] = id;
    accounts.push_back(std::move(entry));
  }

  json queue = json::array();
  for (const auto& [position, id] : s.queue_entries) {
    queue.push_back(json{{"position", position}, {"settlement_id", id}});
  }

  j = json{{"version", 1},
           {"settlements", s.settlements},
           {"next_settlement_id", s.next_settlement_id},
           {"accounts", std::move(accounts)},
           {"balances", s.balances},
           {"queue", std::move(queue)},
           {"next_queue_position", s.next_queue_position},
           {"paused", s.paused},
           {"disputers", s.disputers},
           {"next_event_sequence", s.next_event_sequence}};
}

void from_json(const json& j, EngineSnapshot& s) {
  j.at("settlements").get_to(s.settlements);
  j.at("next_settlement_id").get_to(s.next_settlement_id);

  s.accounts.clear();
  for (const auto& entry : j.at("accounts")) {
    s.accounts.emplace(entry.at("settlement_id").get<domain::SettlementId>(),
                       entry.get<domain::EscrowAccount>());
  }
  j.at("balances").get_to(s.balances);

  s.queue_entries.clear();
  for (const auto& entry : j.at("queue")) {
    s.queue_entries.emplace_back(
        entry.at("position").get<std::uint64_t>(),
        entry.at("settlement_id").get<domain::SettlementId>());
  }
  j.at("next_queue_position").get_to(s.next_queue_position);
  j.at("paused").get_to(s.paused);
  j.at("disputers").get_to(s.disputers);
  j.at("next_event_sequence").get_to(s.next_event_sequence);
}

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------
namespace {

json eventBody(const SettlementCreatedEvent& e) {
  return json{{"type", "settlement_created"},
              {"settlement_id", e.settlement_id},
              {"initiator", e.initiator},
              {"total_amount", e.total_amount},
              {"total_transfers", e.total_transfers},
              {"deadline_ms", e.deadline_ms},
              {"requires_price", e.requires_price}};
}

json eventBody(const DepositReceivedEvent& e) {
  return json{{"type", "deposit_received"},
              {"settlement_id", e.settlement_id},
              {"depositor", e.depositor},
              {"amount", e.amount},
              {"total_deposited", e.total_deposited}};
}

json eventBody(const SettlementInitiatedEvent& e) {
  json j{{"type", "settlement_initiated"},
         {"settlement_id", e.settlement_id},
         {"queue_position", e.queue_position},
         {"price_locked", e.price_locked}};
  j["locked_price"] = e.price_locked ? json(e.locked_price) : json(nullptr);
  return j;
}

json eventBody(const TransfersExecutedEvent& e) {
  return json{{"type", "transfers_executed"},
              {"settlement_id", e.settlement_id},
              {"first_index", e.first_index},
              {"count", e.count},
              {"executed_transfers", e.executed_transfers},
              {"total_transfers", e.total_transfers},
              {"amount_released", e.amount_released}};
}

json eventBody(const SettlementFinalizedEvent& e) {
  return json{{"type", "settlement_finalized"},
              {"settlement_id", e.settlement_id},
              {"total_released", e.total_released}};
}

json eventBody(const SettlementRefundedEvent& e) {
  return json{{"type", "settlement_refunded"},
              {"settlement_id", e.settlement_id},
              {"refunds", e.refunds},
              {"total_refunded", e.total_refunded},
              {"reason", e.reason}};
}

json eventBody(const SettlementDisputedEvent& e) {
  return json{{"type", "settlement_disputed"},
              {"settlement_id", e.settlement_id},
              {"disputed_by", e.disputed_by},
              {"reason", e.reason},
              {"previous_state", stateToJson(e.previous_state)}};
}

json eventBody(const DisputeResolvedEvent& e) {
  return json{{"type", "dispute_resolved"},
              {"settlement_id", e.settlement_id},
              {"outcome", domain::disputeOutcomeToString(e.outcome)},
              {"resulting_state", stateToJson(e.resulting_state)}};
}

json eventBody(const PauseChangedEvent& e) {
  return json{{"type", "pause_changed"},
              {"paused", e.paused},
              {"changed_by", e.changed_by}};
}

}  // namespace

json eventToJson(const Event& event) {
  return std::visit(
      [](const auto& e) {
        json j = eventBody(e);
        j["timestamp_ms"] = e.timestamp_ms;
        j["sequence_id"] = e.sequence_id;
        return j;
      },
      event);
}

}  // namespace settle
