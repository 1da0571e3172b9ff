#include "tradebook/persistence/json_state_store.hpp"
#include "tradebook/domain/errors.hpp"
#include "tradebook/persistence/snapshot_json.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace tradebook {

JsonFileStateStore::JsonFileStateStore(std::filesystem::path path)
    : path_(std::move(path)) {}

// -----------------------------------------------------------------------------
// save(): write temp file, then atomic rename
// -----------------------------------------------------------------------------
void JsonFileStateStore::save(const LedgerSnapshot& snapshot) {
  const nlohmann::json j = snapshot;

  std::filesystem::path tmp = path_;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw StateStoreError("cannot open " + tmp.string() + " for writing");
    }
    out << j.dump(2) << '\n';
    out.flush();
    if (!out) {
      throw StateStoreError("failed writing " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    throw StateStoreError("cannot replace " + path_.string() + ": " +
                          ec.message());
  }
}

// -----------------------------------------------------------------------------
// load(): nullopt if absent, StateStoreError if present but unusable
// -----------------------------------------------------------------------------
std::optional<LedgerSnapshot> JsonFileStateStore::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return std::nullopt;
  }

  std::ifstream in(path_);
  if (!in) {
    throw StateStoreError("cannot open " + path_.string() + " for reading");
  }

  try {
    nlohmann::json j = nlohmann::json::parse(in);
    return j.get<LedgerSnapshot>();
  } catch (const nlohmann::json::exception& e) {
    throw StateStoreError("malformed snapshot " + path_.string() + ": " +
                          e.what());
  } catch (const std::invalid_argument& e) {
    throw StateStoreError("malformed snapshot " + path_.string() + ": " +
                          e.what());
  }
}

}  // namespace tradebook
