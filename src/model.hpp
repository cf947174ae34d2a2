#pragma once
#include "value.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graphkv
{

  // -------------------- entities ---------------------------

  struct Node
  {
    std::string id{};
    PropertyMap properties{};
  };

  struct Edge
  {
    std::string id{};
    std::string source{}; // node id
    std::string target{}; // node id
    PropertyMap properties{};

    bool isSelfLoop() const { return source == target; }
  };

  bool operator==(const Node &a, const Node &b);
  bool operator==(const Edge &a, const Edge &b);

  // logical form: {id, properties} / {id, source, target, properties}
  Value toValue(const Node &node);
  Value toValue(const Edge &edge);

  // per-node edge id sets, kept as sorted unique lists
  struct AdjacencyRecord
  {
    std::string nodeId{};
    std::vector<std::string> outgoing{};
    std::vector<std::string> incoming{};

    bool empty() const { return outgoing.empty() && incoming.empty(); }
  };

  // Forward = edges where the node is source, Backward = edges where it is target.
  enum class Direction : uint8_t
  {
    Forward = 0,
    Backward = 1,
    Any = 2
  };

  const char *directionName(Direction d);
  std::optional<Direction> parseDirection(std::string_view s);

  // -------------------- id generation ---------------------------

  using IdGenerator = std::function<std::string()>;

  // random version-4 uuid, e.g. "3f2b8c1e-9d4a-4f7e-b2a1-0c5d6e7f8a9b"
  std::string randomUuid();
  IdGenerator uuidGenerator();

  // -------------------- sorted id sets ---------------------------

  void sortUnique(std::vector<std::string> &ids);
  bool insertSorted(std::vector<std::string> &ids, const std::string &id);
  bool eraseSorted(std::vector<std::string> &ids, const std::string &id);
  std::vector<std::string> unionSorted(const std::vector<std::string> &a, const std::vector<std::string> &b);

} // namespace graphkv
