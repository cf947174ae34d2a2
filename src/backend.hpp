#pragma once
#include "errors.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graphkv
{

  enum class Partition : uint8_t
  {
    Nodes = 0,
    Edges = 1,
    Adjacency = 2
  };

  const char *partitionName(Partition p);

  using KeyValueMap = std::map<std::string, std::string>;
  // return false to stop iteration
  using RangeCallback = std::function<bool(std::string_view key, std::string_view value)>;

  // Byte-keyed storage capability, partitioned into nodes / edges / adjacency.
  // Every call is blocking. multiPut is atomic per call, nothing spans calls.
  // Failures throw BackendError.
  class Backend
  {
  public:
    virtual ~Backend() = default;

    virtual std::optional<std::string> get(Partition p, std::string_view key) = 0;
    virtual void put(Partition p, std::string_view key, std::string_view value) = 0;
    // missing key is a no-op
    virtual void remove(Partition p, std::string_view key) = 0;

    // found keys only
    virtual KeyValueMap multiGet(Partition p, const std::vector<std::string> &keys) = 0;
    virtual void multiPut(Partition p, const KeyValueMap &entries) = 0;

    // start <= key < end in stored-key order; empty end = unbounded
    virtual void rangeIterate(Partition p, std::string_view start, std::string_view end, const RangeCallback &fn) = 0;

    // idempotent; any other call afterwards throws BackendError
    virtual void close() = 0;
  };

} // namespace graphkv
