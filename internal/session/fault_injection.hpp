#pragma once

#include <cstddef>
#include <optional>

namespace txnstage::session {

/*
  Deterministic failure points, passed explicitly to a Session.

  Defaults inject nothing.
*/
struct FaultInjection {
  // TxnFuture::Wait fails with TimestampUnavailable instead of beginning.
  bool fail_get_timestamp = false;

  // Statement flush fails once this many writes were applied.
  std::optional<std::size_t> fail_flush_after;
};

} // namespace txnstage::session
