#pragma once
#include "value.hpp"
#include <capnp/compat/json.h>
#include <string>
#include <string_view>

namespace graphkv
{

  // Deepest list/map nesting encode accepts (the root is depth 0). Decoders are
  // configured to read anything up to this depth.
  constexpr unsigned kMaxValueDepth = 64;

  // Value tree <-> bytes. Implementations know nothing about entities.
  // encode throws SerializationError for values nested deeper than kMaxValueDepth.
  class Codec
  {
  public:
    virtual ~Codec() = default;

    virtual const char *name() const = 0;
    virtual std::string encode(const Value &value) const = 0;
    // throws SerializationError on malformed input
    virtual Value decode(std::string_view bytes) const = 0;
  };

  // packed Cap'n Proto message of schema::Value
  class CapnpCodec final : public Codec
  {
  public:
    const char *name() const override { return "capnp"; }
    std::string encode(const Value &value) const override;
    Value decode(std::string_view bytes) const override;
  };

  // Cap'n Proto JSON encoding of schema::Value
  class JsonCodec final : public Codec
  {
  public:
    JsonCodec();

    const char *name() const override { return "json"; }
    std::string encode(const Value &value) const override;
    Value decode(std::string_view bytes) const override;

  private:
    capnp::JsonCodec json_;
  };

} // namespace graphkv
