#include "adjacency.hpp"
#include <kj/debug.h>
#include <map>

namespace graphkv
{

  std::optional<AdjacencyRecord> AdjacencyIndex::load(std::string_view nodeId) const
  {
    auto bytes = backend_.get(Partition::Adjacency, nodeId);
    if (!bytes)
      return std::nullopt;
    return codec_.decodeAdjacency(*bytes, nodeId);
  }

  AdjacencyRecord AdjacencyIndex::loadOrEmpty(std::string_view nodeId) const
  {
    if (auto rec = load(nodeId))
      return std::move(*rec);
    AdjacencyRecord rec{};
    rec.nodeId = std::string(nodeId);
    return rec;
  }

  void AdjacencyIndex::store(const AdjacencyRecord &record)
  {
    if (record.empty())
    {
      backend_.remove(Partition::Adjacency, record.nodeId);
      return;
    }
    backend_.put(Partition::Adjacency, record.nodeId, codec_.encode(record));
  }

  void AdjacencyIndex::recordEdge(const Edge &edge)
  {
    if (edge.isSelfLoop())
    {
      if (edge.source.empty())
        return;
      auto rec = loadOrEmpty(edge.source);
      insertSorted(rec.outgoing, edge.id);
      insertSorted(rec.incoming, edge.id);
      store(rec);
      return;
    }

    if (!edge.source.empty())
    {
      auto src = loadOrEmpty(edge.source);
      insertSorted(src.outgoing, edge.id);
      store(src);
    }
    if (!edge.target.empty())
    {
      auto dst = loadOrEmpty(edge.target);
      insertSorted(dst.incoming, edge.id);
      store(dst);
    }
  }

  void AdjacencyIndex::removeEdge(const Edge &edge)
  {
    auto drop = [&](const std::string &nodeId, bool fromOutgoing, bool fromIncoming)
    {
      if (nodeId.empty())
        return;
      auto rec = load(nodeId);
      if (!rec)
        return;
      bool changed = false;
      if (fromOutgoing)
        changed |= eraseSorted(rec->outgoing, edge.id);
      if (fromIncoming)
        changed |= eraseSorted(rec->incoming, edge.id);
      if (changed)
        store(*rec);
    };

    if (edge.isSelfLoop())
    {
      drop(edge.source, true, true);
      return;
    }
    drop(edge.source, true, false);
    drop(edge.target, false, true);
  }

  std::vector<std::string> AdjacencyIndex::query(std::string_view nodeId, Direction direction) const
  {
    auto rec = load(nodeId);
    if (!rec)
      return {};
    switch (direction)
    {
    case Direction::Forward:
      return std::move(rec->outgoing);
    case Direction::Backward:
      return std::move(rec->incoming);
    case Direction::Any:
      return unionSorted(rec->outgoing, rec->incoming);
    }
    return {};
  }

  void AdjacencyIndex::bulkRecord(const std::vector<Edge> &edges)
  {
    if (edges.empty())
      return;

    // node id -> ids introduced by this batch
    std::map<std::string, AdjacencyRecord> added;
    for (const auto &e : edges)
    {
      if (!e.source.empty())
        added[e.source].outgoing.push_back(e.id);
      if (!e.target.empty())
        added[e.target].incoming.push_back(e.id);
    }
    if (added.empty())
      return;

    std::vector<std::string> nodeIds;
    nodeIds.reserve(added.size());
    for (const auto &entry : added)
      nodeIds.push_back(entry.first);
    auto current = backend_.multiGet(Partition::Adjacency, nodeIds);

    KeyValueMap writes;
    for (auto &[nodeId, fresh] : added)
    {
      AdjacencyRecord merged{};
      merged.nodeId = nodeId;
      auto it = current.find(nodeId);
      if (it != current.end())
        merged = codec_.decodeAdjacency(it->second, nodeId);
      sortUnique(fresh.outgoing);
      sortUnique(fresh.incoming);
      merged.outgoing = unionSorted(merged.outgoing, fresh.outgoing);
      merged.incoming = unionSorted(merged.incoming, fresh.incoming);
      writes.emplace(nodeId, codec_.encode(merged));
    }
    backend_.multiPut(Partition::Adjacency, writes);
    KJ_LOG(INFO, "bulk adjacency update", edges.size(), writes.size());
  }

} // namespace graphkv
