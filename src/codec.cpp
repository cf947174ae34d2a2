#include "codec.hpp"
#include "errors.hpp"
#include "schemas/value.capnp.h"
#include <capnp/message.h>
#include <capnp/serialize-packed.h>
#include <kj/debug.h>
#include <kj/io.h>
#include <string>

namespace graphkv
{

  namespace
  {

    // a map level costs the reader two pointer hops (entry list, value struct), a JSON map three objects
    constexpr unsigned kReaderNestingLimit = 4 * kMaxValueDepth + 8;

    void toCapnp(const Value &v, schema::Value::Builder b, unsigned depth = 0)
    {
      if (depth > kMaxValueDepth)
        throw SerializationError("value nested deeper than " + std::to_string(kMaxValueDepth) + " levels");
      if (std::holds_alternative<bool>(v.v))
      {
        b.setBoolv(std::get<bool>(v.v));
        return;
      }
      if (std::holds_alternative<int64_t>(v.v))
      {
        b.setI64(std::get<int64_t>(v.v));
        return;
      }
      if (std::holds_alternative<double>(v.v))
      {
        b.setF64(std::get<double>(v.v));
        return;
      }
      if (std::holds_alternative<std::string>(v.v))
      {
        const auto &s = std::get<std::string>(v.v);
        b.setText(capnp::Text::Reader(s.data(), s.size()));
        return;
      }
      if (std::holds_alternative<ValueList>(v.v))
      {
        const auto &l = std::get<ValueList>(v.v);
        auto lb = b.initList(static_cast<capnp::uint>(l.size()));
        for (size_t i = 0; i < l.size(); ++i)
          toCapnp(l[i], lb[static_cast<capnp::uint>(i)], depth + 1);
        return;
      }
      if (std::holds_alternative<ValueMap>(v.v))
      {
        const auto &m = std::get<ValueMap>(v.v);
        auto mb = b.initMap(static_cast<capnp::uint>(m.size()));
        capnp::uint i = 0;
        for (const auto &[key, val] : m)
        {
          auto entry = mb[i++];
          entry.setKey(capnp::Text::Reader(key.data(), key.size()));
          toCapnp(val, entry.initValue(), depth + 1);
        }
        return;
      }
      b.setNullv();
    }

    Value fromCapnp(schema::Value::Reader r)
    {
      switch (r.which())
      {
      case schema::Value::NULLV:
        return Value{};
      case schema::Value::BOOLV:
        return Value(static_cast<bool>(r.getBoolv()));
      case schema::Value::I64:
        return Value(static_cast<int64_t>(r.getI64()));
      case schema::Value::F64:
        return Value(static_cast<double>(r.getF64()));
      case schema::Value::TEXT:
      {
        auto t = r.getText();
        return Value(std::string(t.begin(), t.size()));
      }
      case schema::Value::LIST:
      {
        ValueList out;
        auto items = r.getList();
        out.reserve(items.size());
        for (auto item : items)
          out.push_back(fromCapnp(item));
        return Value(std::move(out));
      }
      case schema::Value::MAP:
      {
        ValueMap out;
        for (auto entry : r.getMap())
        {
          auto k = entry.getKey();
          out.insert_or_assign(std::string(k.begin(), k.size()), fromCapnp(entry.getValue()));
        }
        return Value(std::move(out));
      }
      }
      throw SerializationError("unknown value tag");
    }

    std::string describe(const kj::Exception &e)
    {
      return std::string(e.getDescription().cStr());
    }

  } // namespace

  // -------------------- packed binary ---------------------------

  std::string CapnpCodec::encode(const Value &value) const
  {
    capnp::MallocMessageBuilder message;
    toCapnp(value, message.initRoot<schema::Value>());
    kj::VectorOutputStream out;
    capnp::writePackedMessage(out, message);
    auto bytes = out.getArray();
    return std::string(reinterpret_cast<const char *>(bytes.begin()), bytes.size());
  }

  Value CapnpCodec::decode(std::string_view bytes) const
  {
    if (bytes.empty())
      throw SerializationError("capnp decode: empty payload");
    try
    {
      kj::ArrayInputStream in(kj::ArrayPtr<const kj::byte>(
          reinterpret_cast<const kj::byte *>(bytes.data()), bytes.size()));
      capnp::ReaderOptions options;
      options.nestingLimit = static_cast<int>(kReaderNestingLimit);
      capnp::PackedMessageReader reader(in, options);
      Value out = fromCapnp(reader.getRoot<schema::Value>());
      if (in.tryGetReadBuffer().size() != 0)
        throw SerializationError("capnp decode: trailing data");
      return out;
    }
    catch (const kj::Exception &e)
    {
      throw SerializationError("capnp decode: " + describe(e));
    }
  }

  // -------------------- json ---------------------------

  JsonCodec::JsonCodec()
  {
    json_.setMaxNestingDepth(kReaderNestingLimit);
  }

  std::string JsonCodec::encode(const Value &value) const
  {
    capnp::MallocMessageBuilder message;
    auto root = message.initRoot<schema::Value>();
    toCapnp(value, root);
    kj::String text = json_.encode(root.asReader());
    return std::string(text.cStr(), text.size());
  }

  Value JsonCodec::decode(std::string_view bytes) const
  {
    try
    {
      capnp::MallocMessageBuilder message;
      auto root = message.initRoot<schema::Value>();
      json_.decode(kj::ArrayPtr<const char>(bytes.data(), bytes.size()), root);
      return fromCapnp(root.asReader());
    }
    catch (const kj::Exception &e)
    {
      throw SerializationError("json decode: " + describe(e));
    }
  }

} // namespace graphkv
