#pragma once
#include "value.hpp"
#include <string>
#include <string_view>

namespace graphkv
{

  // Plain JSON text <-> Value, through capnp::JsonValue. Numbers that are
  // integral and exactly representable become int64, everything else double.
  // Throws SerializationError on invalid JSON.
  Value parseJson(std::string_view text);
  std::string toJson(const Value &value);

} // namespace graphkv
