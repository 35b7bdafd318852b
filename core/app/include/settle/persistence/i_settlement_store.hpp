#pragma once

#include "settle/persistence/engine_snapshot.hpp"

#include <optional>

namespace settle {

// -----------------------------------------------------------------------------
// ISettlementStore: durable backing for SettlementEngine
// -----------------------------------------------------------------------------
//
// @brief  Loads the last committed snapshot at startup and replaces it after
//         every successful mutating operation.
//
// @details
// Contract:
//   load()  std::nullopt when nothing has ever been saved. StorageError when
//           a snapshot exists but cannot be read or decoded.
//   save()  either the whole snapshot becomes the new committed state or the
//           previous one stays intact; on failure it throws StorageError.
//
// SettlementEngine calls both under its own mutex, so implementations do not
// need to be thread-safe.
// -----------------------------------------------------------------------------
class ISettlementStore {
 public:
  virtual ~ISettlementStore() = default;

  virtual std::optional<EngineSnapshot> load() = 0;
  virtual void save(const EngineSnapshot& snapshot) = 0;
};

}  // namespace settle
