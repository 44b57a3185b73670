#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace txnstage::types {

/*
  A single column value of a row image.

  monostate is SQL NULL.
*/
using Datum = std::variant<std::monostate, int64_t, uint64_t, double, std::string>;

using Row = std::vector<Datum>;

} // namespace txnstage::types
