#pragma once
#include "codec.hpp"
#include "model.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace graphkv
{

  enum class EntityKind : uint8_t
  {
    Node = 0,
    Edge = 1,
    Adjacency = 2
  };

  const char *entityKindName(EntityKind kind);

  // Entity-aware wrapper around a Codec. Each kind has its own payload shape:
  //   Node      {id, properties}
  //   Edge      {id, source, target, properties}
  //   Adjacency {outgoing, incoming}   (keyed by node id, no id field)
  class EntityCodec
  {
  public:
    explicit EntityCodec(const Codec &codec) : codec_(codec) {}

    std::string encode(const Node &node) const;
    std::string encode(const Edge &edge) const;
    std::string encode(const AdjacencyRecord &record) const;

    Node decodeNode(std::string_view bytes) const;
    Edge decodeEdge(std::string_view bytes) const;
    AdjacencyRecord decodeAdjacency(std::string_view bytes, std::string_view nodeId) const;

  private:
    const Codec &codec_;
  };

} // namespace graphkv
