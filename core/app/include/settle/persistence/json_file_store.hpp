#pragma once

#include "settle/persistence/i_settlement_store.hpp"

#include <filesystem>
#include <optional>

namespace settle {

// -----------------------------------------------------------------------------
// JsonFileStore
// -----------------------------------------------------------------------------
//
// @brief  ISettlementStore that keeps the snapshot as one JSON document.
//
// @details
// save() writes the document to "<path>.tmp", flushes it and renames it over
// <path>. rename() within one directory replaces the target atomically, so a
// crash leaves either the old or the new snapshot on disk, never a torn one.
// A leftover .tmp from an interrupted save is ignored by load() and
// overwritten by the next save().
//
// Every failure (I/O, JSON decode) is reported as StorageError with the path
// and the underlying message.
// -----------------------------------------------------------------------------
class JsonFileStore final : public ISettlementStore {
 public:
  explicit JsonFileStore(std::filesystem::path path);

  std::optional<EngineSnapshot> load() override;
  void save(const EngineSnapshot& snapshot) override;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  std::filesystem::path tmp_path_;
};

}  // namespace settle
