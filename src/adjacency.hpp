#pragma once
#include "backend.hpp"
#include "entity_codec.hpp"
#include "model.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graphkv
{

  // Per-node outgoing/incoming edge id sets in the adjacency partition.
  //
  // Invariant: for every stored edge e, e.id is in outgoing(e.source) and in
  // incoming(e.target). A node without edges has no record; a removal that
  // empties a record deletes it. Empty endpoint ids (placeholder edges) are
  // never indexed.
  class AdjacencyIndex
  {
  public:
    AdjacencyIndex(Backend &backend, const EntityCodec &codec) : backend_(backend), codec_(codec) {}

    // one read + one write per endpoint (one of each for a self-loop)
    void recordEdge(const Edge &edge);
    // missing records or ids are skipped; unchanged records are not written
    void removeEdge(const Edge &edge);
    // sorted edge ids; Any is the deduplicated union
    std::vector<std::string> query(std::string_view nodeId, Direction direction) const;

    // Collects the new ids per endpoint in one pass, reads every affected
    // record with a single multiGet and writes them back with a single
    // multiPut. Not atomic against other writers of the same records.
    void bulkRecord(const std::vector<Edge> &edges);

    std::optional<AdjacencyRecord> load(std::string_view nodeId) const;

  private:
    AdjacencyRecord loadOrEmpty(std::string_view nodeId) const;
    void store(const AdjacencyRecord &record);

    Backend &backend_;
    const EntityCodec &codec_;
  };

} // namespace graphkv
