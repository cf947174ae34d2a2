#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace graphkv
{

  inline void put_be64(std::string &s, uint64_t x)
  {
    for (int i = 7; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_be32(std::string &s, uint32_t x)
  {
    for (int i = 3; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }

  inline uint64_t read_be64(const unsigned char *p)
  {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint32_t read_be32(const unsigned char *p)
  {
    uint32_t x = 0;
    for (int i = 0; i < 4; ++i)
      x = (x << 8) | p[i];
    return x;
  }

  // interned entity key / keyIds key: <u64 keyId>
  inline std::string key_interned_be(uint64_t keyId)
  {
    std::string k;
    k.reserve(8);
    put_be64(k, keyId);
    return k;
  }

  // idKeys: raw id string
  inline std::string key_id(std::string_view id)
  {
    return std::string(id);
  }

  // meta bucket string keys
  inline std::string key_meta_key_seq() { return std::string("keySeq"); }
  inline std::string key_meta_schema_version() { return std::string("schemaVersion"); }
  inline std::string key_meta_key_mode() { return std::string("keyMode"); }

} // namespace graphkv
