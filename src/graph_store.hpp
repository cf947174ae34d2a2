#pragma once
#include "adjacency.hpp"
#include "backend.hpp"
#include "codec.hpp"
#include "entity_codec.hpp"
#include "model.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace graphkv
{

  // (old properties, incoming data) -> merged properties
  using MergeFn = std::function<PropertyMap(const PropertyMap &, const PropertyMap &)>;

  // incoming keys replace existing ones
  PropertyMap mergeShallow(const PropertyMap &old, const PropertyMap &incoming);
  // like mergeShallow, but nested maps present on both sides are merged recursively
  PropertyMap mergeDeep(const PropertyMap &old, const PropertyMap &incoming);

  // Graph API over a Backend. Nodes and edges are stored as EntityCodec
  // payloads keyed by id; edge writes and deletes keep the AdjacencyIndex in
  // step.
  //
  // Nothing here is atomic across Backend calls: updateNode/updateEdge are
  // read-merge-write and can lose a concurrent update, and deleteEdge can
  // leave a dangling adjacency entry if interrupted. Reads and bfs skip
  // dangling entries. Deleting a node does not touch its edges.
  //
  // The backend is owned by the caller and must outlive the store.
  class GraphStore
  {
  public:
    GraphStore(Backend &backend, const Codec &codec, IdGenerator ids = uuidGenerator());

    GraphStore(const GraphStore &) = delete;
    GraphStore &operator=(const GraphStore &) = delete;

    // entities with a fresh id; nothing is written
    Node makeNode(PropertyMap properties = {});
    Edge makeEdge(std::string source, std::string target, PropertyMap properties = {});

    // nodes
    void putNode(const Node &node);
    std::optional<Node> getNode(std::string_view id);
    void deleteNode(std::string_view id);

    // edges
    void putEdge(const Edge &edge, bool updateAdjacency = true);
    std::optional<Edge> getEdge(std::string_view id);
    void deleteEdge(std::string_view id);

    // Merge-based updates. A missing id is created as an empty entity first.
    Node updateNode(std::string_view id, const PropertyMap &newData, const MergeFn &merge);
    // keeps the stored endpoints; adjacency is not rebuilt
    Edge updateEdge(std::string_view id, const PropertyMap &newData, const MergeFn &merge);

    // bulk
    void putNodes(const std::vector<Node> &nodes);
    std::vector<std::optional<Node>> getNodes(const std::vector<std::string> &ids);
    void putEdgesBulk(const std::vector<Edge> &edges);
    std::vector<std::optional<Edge>> getEdges(const std::vector<std::string> &ids);

    // ordered scans, startId <= id < endId (empty endId = unbounded); return false to stop
    void scanNodes(std::string_view startId, std::string_view endId, const std::function<bool(const Node &)> &fn);
    void scanEdges(std::string_view startId, std::string_view endId, const std::function<bool(const Edge &)> &fn);

    // traversal
    std::vector<std::string> adjacency(std::string_view nodeId, Direction direction = Direction::Any);
    std::vector<std::string> bfs(std::string_view startId, Direction direction = Direction::Any);

    AdjacencyIndex &index() { return index_; }

    // releases the backend
    void close();

  private:
    Backend &backend_;
    EntityCodec codec_;
    AdjacencyIndex index_;
    IdGenerator ids_;
  };

} // namespace graphkv
