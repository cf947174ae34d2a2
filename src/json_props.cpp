#include "json_props.hpp"
#include "errors.hpp"
#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <cmath>

namespace graphkv
{

  namespace
  {

    // 2^53: the largest range where every integer is an exact double
    constexpr double kMaxExactInt = 9007199254740992.0;

    Value fromJsonValue(capnp::JsonValue::Reader j)
    {
      switch (j.which())
      {
      case capnp::JsonValue::BOOLEAN:
        return Value(static_cast<bool>(j.getBoolean()));
      case capnp::JsonValue::NUMBER:
      {
        double d = j.getNumber();
        if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) <= kMaxExactInt)
          return Value(static_cast<int64_t>(d));
        return Value(d);
      }
      case capnp::JsonValue::STRING:
      {
        auto s = j.getString();
        return Value(std::string(s.begin(), s.size()));
      }
      case capnp::JsonValue::ARRAY:
      {
        ValueList out;
        for (auto item : j.getArray())
          out.push_back(fromJsonValue(item));
        return Value(std::move(out));
      }
      case capnp::JsonValue::OBJECT:
      {
        ValueMap out;
        for (auto field : j.getObject())
        {
          auto name = field.getName();
          out.insert_or_assign(std::string(name.begin(), name.size()), fromJsonValue(field.getValue()));
        }
        return Value(std::move(out));
      }
      default:
        // null, and call() expressions which have no property equivalent
        return Value{};
      }
    }

    void toJsonValue(const Value &v, capnp::JsonValue::Builder b)
    {
      if (std::holds_alternative<bool>(v.v))
      {
        b.setBoolean(std::get<bool>(v.v));
        return;
      }
      if (std::holds_alternative<int64_t>(v.v))
      {
        b.setNumber(static_cast<double>(std::get<int64_t>(v.v)));
        return;
      }
      if (std::holds_alternative<double>(v.v))
      {
        b.setNumber(std::get<double>(v.v));
        return;
      }
      if (std::holds_alternative<std::string>(v.v))
      {
        const auto &s = std::get<std::string>(v.v);
        b.setString(capnp::Text::Reader(s.data(), s.size()));
        return;
      }
      if (std::holds_alternative<ValueList>(v.v))
      {
        const auto &l = std::get<ValueList>(v.v);
        auto arr = b.initArray(static_cast<capnp::uint>(l.size()));
        for (size_t i = 0; i < l.size(); ++i)
          toJsonValue(l[i], arr[static_cast<capnp::uint>(i)]);
        return;
      }
      if (std::holds_alternative<ValueMap>(v.v))
      {
        const auto &m = std::get<ValueMap>(v.v);
        auto obj = b.initObject(static_cast<capnp::uint>(m.size()));
        capnp::uint i = 0;
        for (const auto &[key, val] : m)
        {
          auto field = obj[i++];
          field.setName(capnp::Text::Reader(key.data(), key.size()));
          toJsonValue(val, field.initValue());
        }
        return;
      }
      b.setNull();
    }

  } // namespace

  Value parseJson(std::string_view text)
  {
    capnp::JsonCodec json;
    capnp::MallocMessageBuilder message;
    auto root = message.initRoot<capnp::JsonValue>();
    try
    {
      json.decodeRaw(kj::ArrayPtr<const char>(text.data(), text.size()), root);
    }
    catch (const kj::Exception &e)
    {
      throw SerializationError(std::string("invalid json: ") + e.getDescription().cStr());
    }
    return fromJsonValue(root.asReader());
  }

  std::string toJson(const Value &value)
  {
    capnp::JsonCodec json;
    capnp::MallocMessageBuilder message;
    auto root = message.initRoot<capnp::JsonValue>();
    toJsonValue(value, root);
    kj::String text = json.encodeRaw(root.asReader());
    return std::string(text.cStr(), text.size());
  }

} // namespace graphkv
