#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace graphkv
{

  struct Value;
  using ValueList = std::vector<Value>;
  // Value::v holds both aliases while Value is still incomplete. The standard
  // only guarantees that for vector, list and forward_list; std::map with an
  // incomplete mapped type relies on libstdc++/libc++ accepting it.
  using ValueMap = std::map<std::string, Value>;
  using PropertyMap = ValueMap;

  // null(monostate), bool, int64, double, string, list, map
  struct Value
  {
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, ValueList, ValueMap>;

    Storage v{};

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : v(b) {}
    Value(int x) : v(int64_t(x)) {}
    Value(int64_t x) : v(x) {}
    Value(double d) : v(d) {}
    Value(const char *s) : v(std::string(s)) {}
    Value(std::string s) : v(std::move(s)) {}
    Value(ValueList l) : v(std::move(l)) {}
    Value(ValueMap m) : v(std::move(m)) {}

    bool isNull() const { return std::holds_alternative<std::monostate>(v); }

    template <typename T>
    bool is() const
    {
      return std::holds_alternative<T>(v);
    }

    template <typename T>
    const T &as() const
    {
      return std::get<T>(v);
    }

    template <typename T>
    T &as()
    {
      return std::get<T>(v);
    }

    friend bool operator==(const Value &a, const Value &b) { return a.v == b.v; }
  };

  // name of the held alternative, for diagnostics
  const char *typeName(const Value &v);

} // namespace graphkv
