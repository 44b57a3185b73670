#pragma once

#include <string>
#include <utility>

namespace txnstage::kv {

/*
  Portable result codes for the transaction staging layer.

  Storage backends translate their own failures into these.
  Session code never depends on backend error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,

  FutureNotSet,
  TimestampUnavailable,
  InvalidTxnState,

  EmptyValue,
  EntryTooLarge,
  TxnTooLarge,

  WriteConflict,
  AssumptionViolated,

  UnderlyingStoreError,
  FlushFailure,
  InternalInconsistency
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  bool Is(ErrorCode c) const {
    return code == c;
  }

  // Prefixes the message with the failing operation, keeping the code.
  Result Annotate(const std::string& context) const {
    if (code == ErrorCode::OK) {
      return *this;
    }
    return {code, message.empty() ? context : context + ": " + message};
  }

  // Re-codes the failure, keeping the cause in the message.
  Result Wrap(ErrorCode c, const std::string& context) const {
    if (code == ErrorCode::OK) {
      return *this;
    }
    return {c, context + ": [" + ErrorCodeName(code) + "] " + message};
  }

  std::string ToString() const {
    if (code == ErrorCode::OK) {
      return "OK";
    }
    return std::string(ErrorCodeName(code)) + ": " + message;
  }
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::FutureNotSet:
      return "FutureNotSet";
    case ErrorCode::TimestampUnavailable:
      return "TimestampUnavailable";
    case ErrorCode::InvalidTxnState:
      return "InvalidTxnState";
    case ErrorCode::EmptyValue:
      return "EmptyValue";
    case ErrorCode::EntryTooLarge:
      return "EntryTooLarge";
    case ErrorCode::TxnTooLarge:
      return "TxnTooLarge";
    case ErrorCode::WriteConflict:
      return "WriteConflict";
    case ErrorCode::AssumptionViolated:
      return "AssumptionViolated";
    case ErrorCode::UnderlyingStoreError:
      return "UnderlyingStoreError";
    case ErrorCode::FlushFailure:
      return "FlushFailure";
    case ErrorCode::InternalInconsistency:
      return "InternalInconsistency";
  }
  return "Unknown";
}

} // namespace txnstage::kv

#define TXNSTAGE_RETURN_NOT_OK(expr)            \
  do {                                          \
    ::txnstage::kv::Result _txnstage_r = (expr); \
    if (!_txnstage_r) return _txnstage_r;       \
  } while (false)
