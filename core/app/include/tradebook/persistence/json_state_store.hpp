#pragma once

#include "tradebook/persistence/i_state_store.hpp"

#include <filesystem>

namespace tradebook {

// -----------------------------------------------------------------------------
// JsonFileStateStore — LedgerSnapshot as a pretty-printed JSON file
// -----------------------------------------------------------------------------
//
// @brief  File-backed IStateStore using nlohmann::json.
//
// @details
// save() writes to "<path>.tmp" and renames it over <path>, so a crash in the
// middle of a write leaves the previous snapshot intact. Doubles are written
// by nlohmann::json with round-trip precision, which keeps resumption exact.
//
// load():
//   file missing           → std::nullopt
//   unreadable / bad JSON  → StateStoreError
//   wrong shape / version  → StateStoreError
//
// Thread model:
//   Not internally synchronized. The tracker calls it from the ledger loop
//   thread, and from the main thread only while that loop is not running.
// -----------------------------------------------------------------------------
class JsonFileStateStore : public IStateStore {
 public:
  explicit JsonFileStateStore(std::filesystem::path path);

  void save(const LedgerSnapshot& snapshot) override;
  std::optional<LedgerSnapshot> load() override;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace tradebook
