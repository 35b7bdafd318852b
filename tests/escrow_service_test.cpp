// =============================================================================
// escrow_service_test.cpp
// =============================================================================
// Tests for settle::EscrowService::executeCommand, the JSON entry point the
// IPC server calls for every request.
//
// Validates:
//   - A full lifecycle driven purely through JSON commands
//   - Domain errors map to {"status":"error","error":"<Kind>Error"}
//   - Malformed JSON, unknown ops and negative numbers are ValidationError
//   - Query ops (details, queue, balances, invariants, ping)
//   - stop() racing a publishing thread
//
// Design: IPC endpoints are left empty, so no sockets are opened and
// executeCommand() is exercised directly. The lifecycle test binds inproc
// endpoints only.
// =============================================================================

#include "settle/engine/escrow_service.hpp"
#include "settle/network/ipc_server.hpp"
#include "settle/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

using nlohmann::json;

class EscrowServiceTest : public ::testing::Test {
 protected:
  static settle::domain::EscrowConfig makeConfig() {
    settle::domain::EscrowConfig cfg;
    cfg.admin = "admin";
    cfg.ipc_cmd_endpoint.clear();
    cfg.ipc_pub_endpoint.clear();
    return cfg;
  }

  json call(const json& request) {
    return json::parse(service.executeCommand(request.dump()));
  }

  static void expectError(const json& response, const std::string& kind) {
    EXPECT_EQ(response.at("status"), "error") << response.dump();
    EXPECT_EQ(response.at("error"), kind) << response.dump();
    EXPECT_TRUE(response.at("message").is_string());
  }

  settle::SimulationTimeProvider clock{10'000};
  settle::EscrowService service{makeConfig(), clock};
};

// -----------------------------------------------------------------------------
// 1. create -> deposit -> initiate -> execute x2 through JSON
// -----------------------------------------------------------------------------
TEST_F(EscrowServiceTest, LifecycleOverJson) {
  service.start();

  auto created = call({{"op", "create"},
                       {"caller", "alice"},
                       {"timeout_ms", 5000},
                       {"transfers",
                        {{{"from", "alice"}, {"to", "bob"}, {"amount", 70}},
                         {{"from", "alice"}, {"to", "carol"}, {"amount", 30}}}}});
  ASSERT_EQ(created.at("status"), "ok") << created.dump();
  const auto id = created.at("settlement_id").get<std::uint64_t>();
  EXPECT_EQ(id, 1u);

  auto deposited = call({{"op", "deposit"},
                         {"caller", "alice"},
                         {"settlement_id", id},
                         {"amount", 100}});
  EXPECT_EQ(deposited.at("total_deposited"), 100);

  auto ready = call({{"op", "can_initiate"}, {"settlement_id", id}});
  EXPECT_EQ(ready.at("ok"), true);
  EXPECT_EQ(ready.at("reason"), "Ready");

  auto initiated =
      call({{"op", "initiate"}, {"caller", "alice"}, {"settlement_id", id}});
  EXPECT_EQ(initiated.at("queue_position"), 0);
  EXPECT_EQ(call({{"op", "queue_head"}}).at("head"), id);
  EXPECT_EQ(call({{"op", "queue_length"}}).at("length"), 1);

  auto first = call({{"op", "execute"},
                     {"caller", "keeper"},
                     {"settlement_id", id},
                     {"count", 1}});
  EXPECT_EQ(first.at("executed"), 1);
  EXPECT_EQ(first.at("state"), "EXECUTING");

  auto details = call({{"op", "get_details"}, {"settlement_id", id}});
  EXPECT_EQ(details.at("escrow_balance"), 30);
  EXPECT_EQ(details.at("released"), 70);
  EXPECT_EQ(details.at("is_queue_head"), true);
  EXPECT_EQ(details.at("settlement").at("state"), "EXECUTING");

  auto second = call({{"op", "execute"},
                      {"caller", "keeper"},
                      {"settlement_id", id},
                      {"count", 10}});
  EXPECT_EQ(second.at("executed"), 1);
  EXPECT_EQ(second.at("executed_transfers"), 2);
  EXPECT_EQ(second.at("state"), "FINALIZED");

  EXPECT_EQ(call({{"op", "balance_of"}, {"address", "bob"}}).at("balance"), 70);
  EXPECT_EQ(call({{"op", "balance_of"}, {"address", "carol"}}).at("balance"),
            30);
  EXPECT_TRUE(call({{"op", "queue_head"}}).at("head").is_null());
  EXPECT_EQ(call({{"op", "check_invariants"}}).at("holds"), true);
  EXPECT_EQ(call({{"op", "next_settlement_id"}}).at("next_settlement_id"), 2);

  service.stop();
}

// -----------------------------------------------------------------------------
// 2. Domain errors keep their kind on the wire
// -----------------------------------------------------------------------------
TEST_F(EscrowServiceTest, DomainErrorsAreNamed) {
  auto transfer = json{{"from", "a"}, {"to", "b"}, {"amount", 10}};
  call({{"op", "create"},
        {"caller", "alice"},
        {"transfers", json::array({transfer})}});
  call({{"op", "create"},
        {"caller", "bob"},
        {"transfers", json::array({transfer})}});
  for (int id : {1, 2}) {
    const std::string who = id == 1 ? "alice" : "bob";
    call({{"op", "deposit"}, {"caller", who}, {"settlement_id", id},
          {"amount", 10}});
    call({{"op", "initiate"}, {"caller", who}, {"settlement_id", id}});
  }

  expectError(call({{"op", "execute"},
                    {"caller", "bob"},
                    {"settlement_id", 2},
                    {"count", 1}}),
              "QueueOrderError");
  expectError(call({{"op", "get_settlement"}, {"settlement_id", 99}}),
              "NotFoundError");
  expectError(call({{"op", "pause"}, {"caller", "bob"}}), "UnauthorizedError");
  expectError(
      call({{"op", "refund"}, {"caller", "alice"}, {"settlement_id", 1}}),
              "TimeoutNotReachedError");
  expectError(call({{"op", "deposit"},
                    {"caller", "alice"},
                    {"settlement_id", 1},
                    {"amount", 5}}),
              "InvalidStateError");
  expectError(call({{"op", "execute"},
                    {"caller", "alice"},
                    {"settlement_id", 1},
                    {"count", 0}}),
              "InvalidBatchError");

  auto paused = call({{"op", "pause"}, {"caller", "admin"}});
  EXPECT_EQ(paused.at("changed"), true);
  expectError(call({{"op", "execute"},
                    {"caller", "alice"},
                    {"settlement_id", 1},
                    {"count", 1}}),
              "PausedError");
}

// -----------------------------------------------------------------------------
// 3. Bad input never reaches the engine
// -----------------------------------------------------------------------------
TEST_F(EscrowServiceTest, MalformedCommandsAreValidationErrors) {
  expectError(json::parse(service.executeCommand("{not json")),
              "ValidationError");
  expectError(json::parse(service.executeCommand("[1,2,3]")),
              "ValidationError");
  expectError(call({{"caller", "alice"}}), "ValidationError");
  expectError(call({{"op", "teleport"}, {"caller", "alice"}}),
              "ValidationError");
  expectError(call({{"op", "create"},
                    {"caller", "alice"},
                    {"transfers",
                     {{{"from", "a"}, {"to", "b"}, {"amount", -5}}}}}),
              "ValidationError");
  expectError(call({{"op", "deposit"},
                    {"caller", "alice"},
                    {"settlement_id", -1},
                    {"amount", 5}}),
              "ValidationError");
}

// A count past uint32 must not be truncated into a small batch.
TEST_F(EscrowServiceTest, OutOfRangeNumbersAreValidationErrors) {
  call({{"op", "create"},
        {"caller", "alice"},
        {"transfers", {{{"from", "alice"}, {"to", "bob"}, {"amount", 10}}}}});
  call({{"op", "deposit"}, {"caller", "alice"}, {"settlement_id", 1},
        {"amount", 10}});
  call({{"op", "initiate"}, {"caller", "alice"}, {"settlement_id", 1}});

  for (std::uint64_t count : {4294967296ULL, 4294967297ULL}) {
    expectError(call({{"op", "execute"},
                      {"caller", "alice"},
                      {"settlement_id", 1},
                      {"count", count}}),
                "ValidationError");
  }
  auto s = call({{"op", "get_settlement"}, {"settlement_id", 1}});
  EXPECT_EQ(s.at("settlement").at("executed_transfers"), 0);
  EXPECT_EQ(s.at("settlement").at("state"), "INITIATED");

  auto max = call({{"op", "execute"},
                   {"caller", "alice"},
                   {"settlement_id", 1},
                   {"count", 4294967295ULL}});
  EXPECT_EQ(max.at("executed"), 1) << max.dump();
}

// -----------------------------------------------------------------------------
// 4. Administrative ops and disputes
// -----------------------------------------------------------------------------
TEST_F(EscrowServiceTest, DisputeAndResolveOverJson) {
  call({{"op", "create"},
        {"caller", "alice"},
        {"transfers", {{{"from", "alice"}, {"to", "bob"}, {"amount", 10}}}}});
  call({{"op", "deposit"}, {"caller", "carol"}, {"settlement_id", 1},
        {"amount", 10}});

  auto added = call(
      {{"op", "add_disputer"}, {"caller", "admin"}, {"address", "arbiter"}});
  EXPECT_EQ(added.at("changed"), true);

  auto disputed = call({{"op", "dispute"},
                        {"caller", "arbiter"},
                        {"settlement_id", 1},
                        {"reason", "duplicate invoice"}});
  EXPECT_EQ(disputed.at("previous_state"), "PENDING");

  expectError(call({{"op", "resolve_dispute"},
                    {"caller", "admin"},
                    {"settlement_id", 1},
                    {"outcome", "SHRUG"}}),
              "ValidationError");

  auto resolved = call({{"op", "resolve_dispute"},
                        {"caller", "admin"},
                        {"settlement_id", 1},
                        {"outcome", "FORCE_FAIL"}});
  EXPECT_EQ(resolved.at("state"), "FAILED");
  EXPECT_EQ(call({{"op", "balance_of"}, {"address", "carol"}}).at("balance"),
            10);
  EXPECT_EQ(call({{"op", "is_eligible_for_refund"}, {"settlement_id", 1}})
                .at("eligible"),
            false);
}

TEST_F(EscrowServiceTest, ManualPriceOverJson) {
  call({{"op", "create"},
        {"caller", "alice"},
        {"requires_price", true},
        {"transfers", {{{"from", "alice"}, {"to", "bob"}, {"amount", 10}}}}});
  call({{"op", "deposit"}, {"caller", "alice"}, {"settlement_id", 1},
        {"amount", 10}});

  auto blocked = call({{"op", "can_initiate"}, {"settlement_id", 1}});
  EXPECT_EQ(blocked.at("ok"), false);

  auto set = call({{"op", "set_manual_price"},
                   {"caller", "admin"},
                   {"settlement_id", 1},
                   {"price", 250000000}});
  EXPECT_EQ(set.at("status"), "ok");
  EXPECT_TRUE(set.at("previous").is_null());

  auto initiated =
      call({{"op", "initiate"}, {"caller", "alice"}, {"settlement_id", 1}});
  EXPECT_EQ(initiated.at("status"), "ok") << initiated.dump();
  auto s = call({{"op", "get_settlement"}, {"settlement_id", 1}});
  EXPECT_EQ(s.at("settlement").at("locked_price"), 250000000);
}

TEST_F(EscrowServiceTest, Ping) {
  auto pong = call({{"op", "ping"}});
  EXPECT_EQ(pong.at("status"), "ok");
  EXPECT_EQ(pong.at("response"), "PONG");
}

// -----------------------------------------------------------------------------
// 5. stop() while another thread keeps publishing: the bridge is removed and
//    in-flight notifications never touch a destroyed server.
// -----------------------------------------------------------------------------
TEST(EscrowServiceLifecycleTest, StopWhileCommandsPublish) {
  settle::domain::EscrowConfig cfg;
  cfg.admin = "admin";
  cfg.ipc_cmd_endpoint = "inproc://escrow-service-test-cmd";
  cfg.ipc_pub_endpoint = "inproc://escrow-service-test-pub";
  settle::SimulationTimeProvider clock{10'000};
  settle::EscrowService service{cfg, clock};

  const auto baseline = service.eventBus().subscriberCount();
  service.start();
  ASSERT_TRUE(service.isRunning());
  EXPECT_EQ(service.eventBus().subscriberCount(), baseline + 1);

  std::atomic<bool> done{false};
  std::atomic<int> failures{0};
  std::thread writer([&] {
    const json request = {
        {"op", "create"},
        {"caller", "alice"},
        {"transfers", {{{"from", "alice"}, {"to", "bob"}, {"amount", 1}}}}};
    while (!done.load()) {
      auto response = json::parse(service.executeCommand(request.dump()));
      if (response.at("status") != "ok") {
        ++failures;
      }
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  service.stop();
  EXPECT_FALSE(service.isRunning());
  EXPECT_EQ(service.eventBus().subscriberCount(), baseline);

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  done.store(true);
  writer.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_GT(service.engine().nextSettlementId(), 1u);
  service.stop();
}

// -----------------------------------------------------------------------------
// 6. Telemetry frames are the notification JSON, one object per frame
// -----------------------------------------------------------------------------
TEST(IpcServerTest, TelemetryFrameIsEventJson) {
  settle::SettlementFinalizedEvent ev;
  ev.settlement_id = 12;
  ev.total_released = 900;
  ev.timestamp_ms = 77;
  ev.sequence_id = 4;

  auto frame = json::parse(settle::IpcServer::formatTelemetry(ev));
  EXPECT_EQ(frame.at("type"), "settlement_finalized");
  EXPECT_EQ(frame.at("settlement_id"), 12);
  EXPECT_EQ(frame.at("total_released"), 900);
  EXPECT_EQ(frame.at("sequence_id"), 4);
}
