#include "model.hpp"
#include <algorithm>
#include <cstdio>
#include <iterator>
#include <random>

namespace graphkv
{

  bool operator==(const Node &a, const Node &b)
  {
    return a.id == b.id && a.properties == b.properties;
  }

  bool operator==(const Edge &a, const Edge &b)
  {
    return a.id == b.id && a.source == b.source && a.target == b.target && a.properties == b.properties;
  }

  Value toValue(const Node &node)
  {
    ValueMap m;
    m.emplace("id", node.id);
    m.emplace("properties", node.properties);
    return Value(std::move(m));
  }

  Value toValue(const Edge &edge)
  {
    ValueMap m;
    m.emplace("id", edge.id);
    m.emplace("source", edge.source);
    m.emplace("target", edge.target);
    m.emplace("properties", edge.properties);
    return Value(std::move(m));
  }

  const char *directionName(Direction d)
  {
    switch (d)
    {
    case Direction::Forward:
      return "forward";
    case Direction::Backward:
      return "backward";
    case Direction::Any:
      return "any";
    }
    return "any";
  }

  std::optional<Direction> parseDirection(std::string_view s)
  {
    if (s == "forward" || s == "out")
      return Direction::Forward;
    if (s == "backward" || s == "in")
      return Direction::Backward;
    if (s == "any" || s == "both")
      return Direction::Any;
    return std::nullopt;
  }

  std::string randomUuid()
  {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);
    // version 4, variant 10xx
    high = (high & 0xffffffffffff0fffull) | 0x0000000000004000ull;
    low = (low & 0x3fffffffffffffffull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xffff),
                  static_cast<unsigned>(high & 0xffff),
                  static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xffffffffffffull));
    return std::string(buf);
  }

  IdGenerator uuidGenerator()
  {
    return [] { return randomUuid(); };
  }

  void sortUnique(std::vector<std::string> &ids)
  {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  }

  bool insertSorted(std::vector<std::string> &ids, const std::string &id)
  {
    auto it = std::lower_bound(ids.begin(), ids.end(), id);
    if (it != ids.end() && *it == id)
      return false;
    ids.insert(it, id);
    return true;
  }

  bool eraseSorted(std::vector<std::string> &ids, const std::string &id)
  {
    auto it = std::lower_bound(ids.begin(), ids.end(), id);
    if (it == ids.end() || *it != id)
      return false;
    ids.erase(it);
    return true;
  }

  std::vector<std::string> unionSorted(const std::vector<std::string> &a, const std::vector<std::string> &b)
  {
    std::vector<std::string> out;
    out.reserve(a.size() + b.size());
    std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
  }

} // namespace graphkv
