#pragma once

#include <stdexcept>
#include <string>

namespace tradebook {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// TradebookError            base class, catch-all for tradebook failures
//  ├── InvalidEventError     fill violates the input contract (size, price,
//  │                         ids, SELL without a position). Fatal for that
//  │                         event only; the caller drops and reports it.
//  ├── InconsistentStateError a ledger change references a position that
//  │                         does not exist, or would store size <= 0.
//  │                         Thrown before anything is mutated.
//  ├── StateStoreError       snapshot could not be read or written.
//  └── ConfigError           configuration file or value is malformed.
// -----------------------------------------------------------------------------
class TradebookError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidEventError : public TradebookError {
 public:
  using TradebookError::TradebookError;
};

class InconsistentStateError : public TradebookError {
 public:
  using TradebookError::TradebookError;
};

class StateStoreError : public TradebookError {
 public:
  using TradebookError::TradebookError;
};

class ConfigError : public TradebookError {
 public:
  using TradebookError::TradebookError;
};

}  // namespace tradebook
