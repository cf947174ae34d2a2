#include "graph_store.hpp"
#include <kj/debug.h>
#include <deque>
#include <unordered_set>

namespace graphkv
{

  PropertyMap mergeShallow(const PropertyMap &old, const PropertyMap &incoming)
  {
    PropertyMap out = old;
    for (const auto &[key, val] : incoming)
      out.insert_or_assign(key, val);
    return out;
  }

  PropertyMap mergeDeep(const PropertyMap &old, const PropertyMap &incoming)
  {
    PropertyMap out = old;
    for (const auto &[key, val] : incoming)
    {
      auto it = out.find(key);
      if (it != out.end() && it->second.is<ValueMap>() && val.is<ValueMap>())
        it->second = Value(mergeDeep(it->second.as<ValueMap>(), val.as<ValueMap>()));
      else
        out.insert_or_assign(key, val);
    }
    return out;
  }

  GraphStore::GraphStore(Backend &backend, const Codec &codec, IdGenerator ids)
      : backend_(backend), codec_(codec), index_(backend, codec_), ids_(std::move(ids))
  {
    if (!ids_)
      ids_ = uuidGenerator();
  }

  Node GraphStore::makeNode(PropertyMap properties)
  {
    return Node{ids_(), std::move(properties)};
  }

  Edge GraphStore::makeEdge(std::string source, std::string target, PropertyMap properties)
  {
    return Edge{ids_(), std::move(source), std::move(target), std::move(properties)};
  }

  // -------------------- nodes ---------------------------

  void GraphStore::putNode(const Node &node)
  {
    backend_.put(Partition::Nodes, node.id, codec_.encode(node));
  }

  std::optional<Node> GraphStore::getNode(std::string_view id)
  {
    auto bytes = backend_.get(Partition::Nodes, id);
    if (!bytes)
      return std::nullopt;
    return codec_.decodeNode(*bytes);
  }

  void GraphStore::deleteNode(std::string_view id)
  {
    backend_.remove(Partition::Nodes, id);
  }

  // -------------------- edges ---------------------------

  void GraphStore::putEdge(const Edge &edge, bool updateAdjacency)
  {
    backend_.put(Partition::Edges, edge.id, codec_.encode(edge));
    if (updateAdjacency)
      index_.recordEdge(edge);
  }

  std::optional<Edge> GraphStore::getEdge(std::string_view id)
  {
    auto bytes = backend_.get(Partition::Edges, id);
    if (!bytes)
      return std::nullopt;
    return codec_.decodeEdge(*bytes);
  }

  void GraphStore::deleteEdge(std::string_view id)
  {
    auto edge = getEdge(id);
    if (!edge)
      return;
    index_.removeEdge(*edge);
    backend_.remove(Partition::Edges, id);
  }

  // -------------------- merge updates ---------------------------

  Node GraphStore::updateNode(std::string_view id, const PropertyMap &newData, const MergeFn &merge)
  {
    auto node = getNode(id);
    if (!node)
      node = Node{std::string(id), {}};
    node->properties = merge(node->properties, newData);
    putNode(*node);
    return std::move(*node);
  }

  Edge GraphStore::updateEdge(std::string_view id, const PropertyMap &newData, const MergeFn &merge)
  {
    auto edge = getEdge(id);
    if (!edge)
      edge = Edge{std::string(id), {}, {}, {}};
    edge->properties = merge(edge->properties, newData);
    putEdge(*edge, false);
    return std::move(*edge);
  }

  // -------------------- bulk ---------------------------

  void GraphStore::putNodes(const std::vector<Node> &nodes)
  {
    KeyValueMap entries;
    for (const auto &n : nodes)
      entries.insert_or_assign(n.id, codec_.encode(n));
    backend_.multiPut(Partition::Nodes, entries);
  }

  std::vector<std::optional<Node>> GraphStore::getNodes(const std::vector<std::string> &ids)
  {
    auto found = backend_.multiGet(Partition::Nodes, ids);
    std::vector<std::optional<Node>> out;
    out.reserve(ids.size());
    for (const auto &id : ids)
    {
      auto it = found.find(id);
      if (it == found.end())
        out.emplace_back(std::nullopt);
      else
        out.emplace_back(codec_.decodeNode(it->second));
    }
    return out;
  }

  void GraphStore::putEdgesBulk(const std::vector<Edge> &edges)
  {
    KeyValueMap entries;
    for (const auto &e : edges)
      entries.insert_or_assign(e.id, codec_.encode(e));
    backend_.multiPut(Partition::Edges, entries);
    index_.bulkRecord(edges);
  }

  std::vector<std::optional<Edge>> GraphStore::getEdges(const std::vector<std::string> &ids)
  {
    auto found = backend_.multiGet(Partition::Edges, ids);
    std::vector<std::optional<Edge>> out;
    out.reserve(ids.size());
    for (const auto &id : ids)
    {
      auto it = found.find(id);
      if (it == found.end())
        out.emplace_back(std::nullopt);
      else
        out.emplace_back(codec_.decodeEdge(it->second));
    }
    return out;
  }

  void GraphStore::scanNodes(std::string_view startId, std::string_view endId, const std::function<bool(const Node &)> &fn)
  {
    backend_.rangeIterate(Partition::Nodes, startId, endId,
                          [&](std::string_view, std::string_view value)
                          { return fn(codec_.decodeNode(value)); });
  }

  void GraphStore::scanEdges(std::string_view startId, std::string_view endId, const std::function<bool(const Edge &)> &fn)
  {
    backend_.rangeIterate(Partition::Edges, startId, endId,
                          [&](std::string_view, std::string_view value)
                          { return fn(codec_.decodeEdge(value)); });
  }

  // -------------------- traversal ---------------------------

  std::vector<std::string> GraphStore::adjacency(std::string_view nodeId, Direction direction)
  {
    return index_.query(nodeId, direction);
  }

  std::vector<std::string> GraphStore::bfs(std::string_view startId, Direction direction)
  {
    std::vector<std::string> order;
    std::unordered_set<std::string> visited;
    std::deque<std::string> queue;
    queue.emplace_back(startId);

    while (!queue.empty())
    {
      std::string current = std::move(queue.front());
      queue.pop_front();
      if (!visited.insert(current).second)
        continue;
      order.push_back(current);

      for (const auto &edgeId : index_.query(current, direction))
      {
        auto edge = getEdge(edgeId);
        if (!edge)
        {
          KJ_LOG(INFO, "bfs: skipping dangling edge", edgeId.c_str(), current.c_str());
          continue;
        }
        const std::string &neighbor = edge->source == current ? edge->target : edge->source;
        if (!visited.count(neighbor))
          queue.push_back(neighbor);
      }
    }
    return order;
  }

  void GraphStore::close()
  {
    backend_.close();
  }

} // namespace graphkv
