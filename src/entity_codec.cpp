#include "entity_codec.hpp"
#include "errors.hpp"

namespace graphkv
{

  const char *entityKindName(EntityKind kind)
  {
    switch (kind)
    {
    case EntityKind::Node:
      return "node";
    case EntityKind::Edge:
      return "edge";
    case EntityKind::Adjacency:
      return "adjacency";
    }
    return "entity";
  }

  namespace
  {

    [[noreturn]] void corrupt(EntityKind kind, const std::string &what)
    {
      throw SerializationError(std::string("corrupt ") + entityKindName(kind) + " payload: " + what);
    }

    const ValueMap &expectMap(const Value &v, EntityKind kind)
    {
      if (!v.is<ValueMap>())
        corrupt(kind, std::string("expected map, got ") + typeName(v));
      return v.as<ValueMap>();
    }

    const Value &field(const ValueMap &m, const char *name, EntityKind kind)
    {
      auto it = m.find(name);
      if (it == m.end())
        corrupt(kind, std::string("missing field '") + name + "'");
      return it->second;
    }

    std::string textField(const ValueMap &m, const char *name, EntityKind kind)
    {
      const Value &v = field(m, name, kind);
      if (!v.is<std::string>())
        corrupt(kind, std::string("field '") + name + "' is " + typeName(v));
      return v.as<std::string>();
    }

    PropertyMap propsField(const ValueMap &m, EntityKind kind)
    {
      auto it = m.find("properties");
      if (it == m.end() || it->second.isNull())
        return {};
      return expectMap(it->second, kind);
    }

    Value idList(const std::vector<std::string> &ids)
    {
      ValueList out;
      out.reserve(ids.size());
      for (const auto &id : ids)
        out.emplace_back(id);
      return Value(std::move(out));
    }

    std::vector<std::string> idListField(const ValueMap &m, const char *name, EntityKind kind)
    {
      std::vector<std::string> out;
      auto it = m.find(name);
      if (it == m.end() || it->second.isNull())
        return out;
      if (!it->second.is<ValueList>())
        corrupt(kind, std::string("field '") + name + "' is " + typeName(it->second));
      for (const auto &item : it->second.as<ValueList>())
      {
        if (!item.is<std::string>())
          corrupt(kind, std::string("non-string edge id in '") + name + "'");
        out.push_back(item.as<std::string>());
      }
      sortUnique(out);
      return out;
    }

  } // namespace

  std::string EntityCodec::encode(const Node &node) const
  {
    return codec_.encode(toValue(node));
  }

  std::string EntityCodec::encode(const Edge &edge) const
  {
    return codec_.encode(toValue(edge));
  }

  std::string EntityCodec::encode(const AdjacencyRecord &record) const
  {
    auto outgoing = record.outgoing;
    auto incoming = record.incoming;
    sortUnique(outgoing);
    sortUnique(incoming);
    ValueMap m;
    m.emplace("outgoing", idList(outgoing));
    m.emplace("incoming", idList(incoming));
    return codec_.encode(Value(std::move(m)));
  }

  Node EntityCodec::decodeNode(std::string_view bytes) const
  {
    Value v = codec_.decode(bytes);
    const auto &m = expectMap(v, EntityKind::Node);
    Node out{};
    out.id = textField(m, "id", EntityKind::Node);
    out.properties = propsField(m, EntityKind::Node);
    return out;
  }

  Edge EntityCodec::decodeEdge(std::string_view bytes) const
  {
    Value v = codec_.decode(bytes);
    const auto &m = expectMap(v, EntityKind::Edge);
    Edge out{};
    out.id = textField(m, "id", EntityKind::Edge);
    out.source = textField(m, "source", EntityKind::Edge);
    out.target = textField(m, "target", EntityKind::Edge);
    out.properties = propsField(m, EntityKind::Edge);
    return out;
  }

  AdjacencyRecord EntityCodec::decodeAdjacency(std::string_view bytes, std::string_view nodeId) const
  {
    Value v = codec_.decode(bytes);
    const auto &m = expectMap(v, EntityKind::Adjacency);
    AdjacencyRecord out{};
    out.nodeId = std::string(nodeId);
    out.outgoing = idListField(m, "outgoing", EntityKind::Adjacency);
    out.incoming = idListField(m, "incoming", EntityKind::Adjacency);
    return out;
  }

} // namespace graphkv
