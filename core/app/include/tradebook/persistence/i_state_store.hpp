#pragma once

#include "tradebook/ledger/ledger_snapshot.hpp"

#include <optional>

namespace tradebook {

// -----------------------------------------------------------------------------
// IStateStore — persistence contract for ledger snapshots
// -----------------------------------------------------------------------------
//
// @brief  Saves and loads the tracker's LedgerSnapshot across restarts.
//
// @details
// The tracker calls load() once in start(), before the ledger loop runs, and
// restores the result into its PositionLedger. It calls save() on the ledger
// loop thread after every processed fill and once more in stop().
//
// Resuming from any saved snapshot and replaying the fills that followed it
// must reproduce the same final ledger; implementations therefore store the
// rows and the history exactly, without rounding.
//
// Error contract:
//   load() returns std::nullopt when no snapshot exists yet, and throws
//   StateStoreError when one exists but cannot be read or parsed.
//   save() throws StateStoreError when the snapshot cannot be written.
//
// Ownership:
//   The tracker holds a non-owning pointer; the caller keeps the store alive
//   until the tracker has stopped.
// -----------------------------------------------------------------------------
class IStateStore {
 public:
  virtual ~IStateStore() = default;

  virtual void save(const LedgerSnapshot& snapshot) = 0;
  virtual std::optional<LedgerSnapshot> load() = 0;
};

// -----------------------------------------------------------------------------
// InMemoryStateStore — keeps the last saved snapshot in memory
// -----------------------------------------------------------------------------
// For tests and dry runs. Not thread-safe; the tracker only touches it from
// one thread at a time.
// -----------------------------------------------------------------------------
class InMemoryStateStore : public IStateStore {
 public:
  void save(const LedgerSnapshot& snapshot) override {
    saved_ = snapshot;
    ++save_count_;
  }

  std::optional<LedgerSnapshot> load() override { return saved_; }

  int saveCount() const { return save_count_; }

 private:
  std::optional<LedgerSnapshot> saved_;
  int save_count_{0};
};

}  // namespace tradebook
