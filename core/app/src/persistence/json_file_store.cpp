#include "settle/persistence/json_file_store.hpp"

#include "settle/codec/json_codec.hpp"
#include "settle/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace settle {

namespace fs = std::filesystem;

JsonFileStore::JsonFileStore(fs::path path)
    : path_(std::move(path)), tmp_path_(path_) {
  tmp_path_ += ".tmp";
}

// -----------------------------------------------------------------------------
// load()
// -----------------------------------------------------------------------------
std::optional<EngineSnapshot> JsonFileStore::load() {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    if (ec) {
      throw StorageError("Cannot stat " + path_.string() + ": " + ec.message());
    }
    return std::nullopt;
  }

  std::ifstream in(path_);
  if (!in) {
    throw StorageError("Cannot open " + path_.string() + " for reading");
  }

  try {
    nlohmann::json doc = nlohmann::json::parse(in);
    EngineSnapshot snapshot = doc.get<EngineSnapshot>();
    std::cout << "[JsonFileStore] loaded " << snapshot.settlements.size()
              << " settlements from " << path_.string() << "\n";
    return snapshot;
  } catch (const nlohmann::json::exception& e) {
    throw StorageError("Corrupt snapshot " + path_.string() + ": " + e.what());
  } catch (const ValidationError& e) {
    throw StorageError("Corrupt snapshot " + path_.string() + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// save(): write temp file, then atomic rename
// -----------------------------------------------------------------------------
void JsonFileStore::save(const EngineSnapshot& snapshot) {
  std::string body;
  try {
    body = nlohmann::json(snapshot).dump(2);
  } catch (const nlohmann::json::exception& e) {
    throw StorageError("Cannot encode snapshot: " + std::string(e.what()));
  }

  {
    std::ofstream out(tmp_path_, std::ios::out | std::ios::trunc);
    if (!out) {
      throw StorageError("Cannot open " + tmp_path_.string() + " for writing");
    }
    out << body;
    out.flush();
    if (!out) {
      throw StorageError("Write to " + tmp_path_.string() + " failed");
    }
  }

  std::error_code ec;
  fs::rename(tmp_path_, path_, ec);
  if (ec) {
    throw StorageError("Cannot replace " + path_.string() + ": " +
                       ec.message());
  }
}

}  // namespace settle
