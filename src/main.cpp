#include "codec.hpp"
#include "errors.hpp"
#include "graph_store.hpp"
#include "json_props.hpp"
#include "leveldb_backend.hpp"
#include "lmdb_backend.hpp"
#include <kj/main.h>
#include <kj/debug.h>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

  using graphkv::Value;
  using graphkv::ValueList;
  using graphkv::ValueMap;

  graphkv::PropertyMap propsFromJson(const std::string &text)
  {
    if (text.empty())
      return {};
    Value v = graphkv::parseJson(text);
    if (v.isNull())
      return {};
    if (!v.is<ValueMap>())
      throw graphkv::SerializationError("properties must be a json object");
    return v.as<ValueMap>();
  }

  std::string optionalText(const ValueMap &m, const char *name)
  {
    auto it = m.find(name);
    if (it == m.end() || it->second.isNull())
      return {};
    if (!it->second.is<std::string>())
      throw graphkv::SerializationError(std::string("field '") + name + "' must be a string");
    return it->second.as<std::string>();
  }

  graphkv::PropertyMap optionalProps(const ValueMap &m)
  {
    auto it = m.find("properties");
    if (it == m.end() || it->second.isNull())
      return {};
    if (!it->second.is<ValueMap>())
      throw graphkv::SerializationError("field 'properties' must be an object");
    return it->second.as<ValueMap>();
  }

  Value idsToValue(const std::vector<std::string> &ids)
  {
    ValueList out;
    out.reserve(ids.size());
    for (const auto &id : ids)
      out.emplace_back(id);
    return Value(std::move(out));
  }

  void print(const Value &v)
  {
    std::cout << graphkv::toJson(v) << "\n";
  }

} // namespace

class GraphkvApp
{
public:
  explicit GraphkvApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "graphkv: node/edge store with an adjacency index over LMDB or LevelDB")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'d', "data"}, KJ_BIND_METHOD(*this, optData),
                          "dir", "data directory (default: data)")
        .addOptionWithArg({'e', "engine"}, KJ_BIND_METHOD(*this, optEngine),
                          "name", "storage engine: lmdb or leveldb (default: lmdb)")
        .addOptionWithArg({'m', "map-size"}, KJ_BIND_METHOD(*this, optMapSize),
                          "MiB", "LMDB map size in MiB (default: 1024)")
        .addOption({'j', "json"}, KJ_BIND_METHOD(*this, optJson),
                   "encode payloads as JSON instead of packed capnp")
        .addOption({'k', "intern-keys"}, KJ_BIND_METHOD(*this, optInternKeys),
                   "store keys as interned 64-bit ids (lmdb only)")
        .addSubCommand("put-node", KJ_BIND_METHOD(*this, cmdPutNode), "store a node")
        .addSubCommand("get-node", KJ_BIND_METHOD(*this, cmdGetNode), "print a node")
        .addSubCommand("delete-node", KJ_BIND_METHOD(*this, cmdDeleteNode), "delete a node (edges are kept)")
        .addSubCommand("update-node", KJ_BIND_METHOD(*this, cmdUpdateNode), "merge properties into a node")
        .addSubCommand("put-edge", KJ_BIND_METHOD(*this, cmdPutEdge), "store an edge and index it")
        .addSubCommand("get-edge", KJ_BIND_METHOD(*this, cmdGetEdge), "print an edge")
        .addSubCommand("delete-edge", KJ_BIND_METHOD(*this, cmdDeleteEdge), "delete an edge and unindex it")
        .addSubCommand("neighbors", KJ_BIND_METHOD(*this, cmdNeighbors), "print the edge ids adjacent to a node")
        .addSubCommand("bfs", KJ_BIND_METHOD(*this, cmdBfs), "breadth-first traversal from a node")
        .addSubCommand("import", KJ_BIND_METHOD(*this, cmdImport), "bulk-load nodes and edges from a JSON-lines file")
        .build();
  }

private:
  kj::ProcessContext &context_;
  kj::String dataDir_ = kj::heapString("data");
  size_t mapSizeBytes_ = size_t(1ull << 30);
  bool json_ = false;
  bool internKeys_ = false;
  bool leveldb_ = false;
  std::vector<std::string> args_;
  graphkv::Direction direction_ = graphkv::Direction::Any;

  // -------------------- options ---------------------------

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optData(kj::StringPtr value)
  {
    dataDir_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optMapSize(kj::StringPtr value)
  {
    size_t mib = 0;
    auto [ptr, ec] = std::from_chars(value.begin(), value.end(), mib);
    if (ec != std::errc() || ptr != value.end() || mib == 0)
      return kj::str("invalid map size: ", value);
    mapSizeBytes_ = mib << 20;
    return true;
  }

  kj::MainBuilder::Validity optEngine(kj::StringPtr value)
  {
    if (value == "lmdb")
      leveldb_ = false;
    else if (value == "leveldb")
      leveldb_ = true;
    else
      return kj::str("unknown engine: ", value, " (expected lmdb or leveldb)");
    return true;
  }

  kj::MainBuilder::Validity optJson()
  {
    json_ = true;
    return true;
  }

  kj::MainBuilder::Validity optInternKeys()
  {
    internKeys_ = true;
    return true;
  }

  kj::MainBuilder::Validity pushArg(kj::StringPtr value)
  {
    args_.emplace_back(value.cStr(), value.size());
    return true;
  }

  kj::MainBuilder::Validity argDirection(kj::StringPtr value)
  {
    auto d = graphkv::parseDirection(std::string_view(value.cStr(), value.size()));
    if (!d)
      return kj::str("unknown direction: ", value, " (expected forward, backward or any)");
    direction_ = *d;
    return true;
  }

  std::string arg(size_t i) const { return i < args_.size() ? args_[i] : std::string(); }

  // -------------------- store lifecycle ---------------------------

  std::unique_ptr<graphkv::Backend> openBackend() const
  {
    if (leveldb_)
    {
      graphkv::LevelDbOptions options;
      options.path = std::filesystem::path(dataDir_.cStr());
      return std::make_unique<graphkv::LevelDbBackend>(options);
    }
    graphkv::LmdbOptions options;
    options.path = std::filesystem::path(dataDir_.cStr());
    options.mapSizeBytes = mapSizeBytes_;
    options.internKeys = internKeys_;
    return std::make_unique<graphkv::LmdbBackend>(options);
  }

  kj::MainBuilder::Validity withStore(const std::function<void(graphkv::GraphStore &)> &fn)
  {
    if (leveldb_ && internKeys_)
      return kj::MainBuilder::Validity("--intern-keys requires the lmdb engine");
    try
    {
      auto backend = openBackend();

      graphkv::CapnpCodec binary;
      graphkv::JsonCodec json;
      const graphkv::Codec &codec = json_ ? static_cast<const graphkv::Codec &>(json) : binary;

      graphkv::GraphStore store(*backend, codec);
      fn(store);
      store.close();
    }
    catch (const graphkv::SerializationError &e)
    {
      return kj::str("serialization error: ", e.what());
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }

  // -------------------- nodes ---------------------------

  kj::MainFunc cmdPutNode()
  {
    return kj::MainBuilder(context_, "0.1", "Store a node with optional JSON object properties.")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .expectOptionalArg("<props-json>", KJ_BIND_METHOD(*this, pushArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runPutNode))
        .build();
  }

  kj::MainBuilder::Validity runPutNode()
  {
    return withStore([&](graphkv::GraphStore &store)
                     {
      graphkv::Node node{arg(0), propsFromJson(arg(1))};
      store.putNode(node);
      print(graphkv::toValue(node)); });
  }

  kj::MainFunc cmdGetNode()
  {
    return kj::MainBuilder(context_, "0.1", "Print a node as JSON, or null when absent.")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runGetNode))
        .build();
  }

  kj::MainBuilder::Validity runGetNode()
  {
    return withStore([&](graphkv::GraphStore &store)
                     {
      auto node = store.getNode(arg(0));
      print(node ? graphkv::toValue(*node) : Value{}); });
  }

  kj::MainFunc cmdDeleteNode()
  {
    return kj::MainBuilder(context_, "0.1", "Delete a node. Its edges are left in place.")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runDeleteNode))
        .build();
  }

  kj::MainBuilder::Validity runDeleteNode()
  {
    return withStore([&](graphkv::GraphStore &store)
                     { store.deleteNode(arg(0)); });
  }

  kj::MainFunc cmdUpdateNode()
  {
    return kj::MainBuilder(context_, "0.1", "Shallow-merge JSON properties into a node, creating it when absent.")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .expectArg("<props-json>", KJ_BIND_METHOD(*this, pushArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runUpdateNode))
        .build();
  }

  kj::MainBuilder::Validity runUpdateNode()
  {
    return withStore([&](graphkv::GraphStore &store)
                     {
      auto node = store.updateNode(arg(0), propsFromJson(arg(1)), graphkv::mergeShallow);
      print(graphkv::toValue(node)); });
  }

  // -------------------- edges ---------------------------

  kj::MainFunc cmdPutEdge()
  {
    return kj::MainBuilder(context_, "0.1", "Store an edge and record it in both endpoints' adjacency.")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .expectArg("<source>", KJ_BIND_METHOD(*this, pushArg))
        .expectArg("<target>", KJ_BIND_METHOD(*this, pushArg))
        .expectOptionalArg("<props-json>", KJ_BIND_METHOD(*this, pushArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runPutEdge))
        .build();
  }

  kj::MainBuilder::Validity runPutEdge()
  {
    return withStore([&](graphkv::GraphStore &store)
                     {
      graphkv::Edge edge{arg(0), arg(1), arg(2), propsFromJson(arg(3))};
      store.putEdge(edge);
      print(graphkv::toValue(edge)); });
  }

  kj::MainFunc cmdGetEdge()
  {
    return kj::MainBuilder(context_, "0.1", "Print an edge as JSON, or null when absent.")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runGetEdge))
        .build();
  }

  kj::MainBuilder::Validity runGetEdge()
  {
    return withStore([&](graphkv::GraphStore &store)
                     {
      auto edge = store.getEdge(arg(0));
      print(edge ? graphkv::toValue(*edge) : Value{}); });
  }

  kj::MainFunc cmdDeleteEdge()
  {
    return kj::MainBuilder(context_, "0.1", "Delete an edge and remove it from its endpoints' adjacency.")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runDeleteEdge))
        .build();
  }

  kj::MainBuilder::Validity runDeleteEdge()
  {
    return withStore([&](graphkv::GraphStore &store)
                     { store.deleteEdge(arg(0)); });
  }

  // -------------------- traversal ---------------------------

  kj::MainFunc cmdNeighbors()
  {
    return kj::MainBuilder(context_, "0.1", "Print the edge ids adjacent to a node (default direction: any).")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .expectOptionalArg("<direction>", KJ_BIND_METHOD(*this, argDirection))
        .callAfterParsing(KJ_BIND_METHOD(*this, runNeighbors))
        .build();
  }

  kj::MainBuilder::Validity runNeighbors()
  {
    return withStore([&](graphkv::GraphStore &store)
                     { print(idsToValue(store.adjacency(arg(0), direction_))); });
  }

  kj::MainFunc cmdBfs()
  {
    return kj::MainBuilder(context_, "0.1", "Print node ids in breadth-first order (default direction: any).")
        .expectArg("<id>", KJ_BIND_METHOD(*this, pushArg))
        .expectOptionalArg("<direction>", KJ_BIND_METHOD(*this, argDirection))
        .callAfterParsing(KJ_BIND_METHOD(*this, runBfs))
        .build();
  }

  kj::MainBuilder::Validity runBfs()
  {
    return withStore([&](graphkv::GraphStore &store)
                     { print(idsToValue(store.bfs(arg(0), direction_))); });
  }

  // -------------------- bulk import ---------------------------

  kj::MainFunc cmdImport()
  {
    return kj::MainBuilder(context_, "0.1",
                           "Bulk-load a JSON-lines file. Objects with \"source\" and \"target\" are edges, "
                           "anything else is a node; a missing \"id\" is generated.")
        .expectArg("<file>", KJ_BIND_METHOD(*this, pushArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, runImport))
        .build();
  }

  kj::MainBuilder::Validity runImport()
  {
    std::ifstream in(arg(0));
    if (!in)
      return kj::str("cannot open ", arg(0).c_str());

    return withStore([&](graphkv::GraphStore &store)
                     {
      std::vector<graphkv::Node> nodes;
      std::vector<graphkv::Edge> edges;
      std::string line;
      size_t lineNo = 0;
      while (std::getline(in, line))
      {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
          continue;
        Value v;
        try
        {
          v = graphkv::parseJson(line);
        }
        catch (const graphkv::SerializationError &e)
        {
          throw graphkv::SerializationError("line " + std::to_string(lineNo) + ": " + e.what());
        }
        if (!v.is<ValueMap>())
          throw graphkv::SerializationError("line " + std::to_string(lineNo) + ": expected a json object");
        const auto &m = v.as<ValueMap>();
        std::string id = optionalText(m, "id");
        if (m.count("source") && m.count("target"))
        {
          auto edge = store.makeEdge(optionalText(m, "source"), optionalText(m, "target"), optionalProps(m));
          if (!id.empty())
            edge.id = id;
          edges.push_back(std::move(edge));
        }
        else
        {
          auto node = store.makeNode(optionalProps(m));
          if (!id.empty())
            node.id = id;
          nodes.push_back(std::move(node));
        }
      }
      if (!nodes.empty())
        store.putNodes(nodes);
      if (!edges.empty())
        store.putEdgesBulk(edges);
      KJ_LOG(INFO, "import finished", nodes.size(), edges.size());
      ValueMap summary;
      summary.emplace("nodes", static_cast<int64_t>(nodes.size()));
      summary.emplace("edges", static_cast<int64_t>(edges.size()));
      print(Value(std::move(summary))); });
  }
};

KJ_MAIN(GraphkvApp);
