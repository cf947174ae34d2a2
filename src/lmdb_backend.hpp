#pragma once
#include "backend.hpp"
#include "env.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>

namespace graphkv
{

  struct LmdbOptions
  {
    std::filesystem::path path{"data"};
    size_t mapSizeBytes{size_t(1ull << 30)};
    // store entity keys as interned u64 ids instead of raw id strings
    bool internKeys{false};
  };

  // Backend over one LMDB environment. Every call runs in its own
  // transaction, so multiPut is a single atomic commit.
  //
  // LMDB cannot store an empty key or one longer than mdb_env_get_maxkeysize.
  // Such ids read as absent and removing them is a no-op; writing one throws
  // MdbError.
  //
  // rangeIterate reads in batches and runs the callback with no transaction
  // open, so the callback may call back into the backend. Each batch is its own
  // snapshot.
  //
  // With internKeys the first write of an id allocates the next u64 from the
  // meta keySeq counter and records it in idKeys/keyIds; reads of an id that
  // was never written do not allocate. The mode is fixed when the database is
  // first created.
  class LmdbBackend final : public Backend
  {
  public:
    explicit LmdbBackend(const LmdbOptions &options);

    std::optional<std::string> get(Partition p, std::string_view key) override;
    void put(Partition p, std::string_view key, std::string_view value) override;
    void remove(Partition p, std::string_view key) override;
    KeyValueMap multiGet(Partition p, const std::vector<std::string> &keys) override;
    void multiPut(Partition p, const KeyValueMap &entries) override;
    void rangeIterate(Partition p, std::string_view start, std::string_view end, const RangeCallback &fn) override;
    void close() override;

    bool internsKeys() const { return options_.internKeys; }
    // interned id for `key`, if one was ever allocated
    std::optional<uint64_t> internedKey(std::string_view key);

  private:
    void ensureKeyMode();
    bool storable(std::string_view key) const { return !key.empty() && key.size() <= maxKeySize_; }
    std::optional<std::string> storageKey(Txn &tx, std::string_view key);
    std::string storageKeyForWrite(Txn &tx, std::string_view key);
    std::string originalKey(Txn &tx, std::string_view stored);

    LmdbOptions options_;
    Env env_;
    size_t maxKeySize_{0};
  };

} // namespace graphkv
