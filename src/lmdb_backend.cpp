#include "lmdb_backend.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <kj/debug.h>
#include <utility>
#include <vector>

namespace graphkv
{
  // -------------------- raw lmdb helpers --------------------

  static inline MDB_val make_val(std::string_view s)
  {
    return MDB_val{s.size(), const_cast<char *>(s.data())};
  }

  static inline std::string_view view_of(const MDB_val &v)
  {
    return std::string_view(static_cast<const char *>(v.mv_data), v.mv_size);
  }

  static bool mdb_get_val(MDB_txn *tx, DbHandle dbi, std::string_view key, MDB_val &out)
  {
    MDB_val k = make_val(key);
    int rc = mdb_get(tx, dbi, &k, &out);
    if (rc == MDB_NOTFOUND)
      return false;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return true;
  }

  static void mdb_put_val(MDB_txn *tx, DbHandle dbi, std::string_view key, std::string_view value)
  {
    MDB_val k = make_val(key);
    MDB_val v = make_val(value);
    int rc = mdb_put(tx, dbi, &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  static void mdb_del_val(MDB_txn *tx, DbHandle dbi, std::string_view key)
  {
    MDB_val k = make_val(key);
    int rc = mdb_del(tx, dbi, &k, nullptr);
    if (rc != 0 && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  // -------------------- meta helpers (schema, sequences) --------------------

  static uint64_t read_u64_or(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t fallback)
  {
    MDB_val v{};
    if (!mdb_get_val(tx, dbi, key, v))
      return fallback;
    if (v.mv_size != 8)
      throw MdbError("corrupt meta counter");
    return read_be64(static_cast<const unsigned char *>(v.mv_data));
  }

  static void write_u64(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t value)
  {
    mdb_put_val(tx, dbi, key, key_interned_be(value));
  }

  static std::optional<uint32_t> read_u32(MDB_txn *tx, DbHandle dbi, std::string_view key)
  {
    MDB_val v{};
    if (!mdb_get_val(tx, dbi, key, v))
      return std::nullopt;
    if (v.mv_size != 4)
      throw MdbError("corrupt meta value");
    return read_be32(static_cast<const unsigned char *>(v.mv_data));
  }

  static void write_u32(MDB_txn *tx, DbHandle dbi, std::string_view key, uint32_t value)
  {
    std::string v;
    v.reserve(4);
    put_be32(v, value);
    mdb_put_val(tx, dbi, key, v);
  }

  static uint64_t incr_meta_seq(Txn &tx, Env &env, const std::string &key)
  {
    uint64_t next = read_u64_or(tx.get(), env.meta(), key, 0) + 1;
    write_u64(tx.get(), env.meta(), key, next);
    return next;
  }

  // -------------------- key interning --------------------

  static std::optional<uint64_t> lookup_key_id(Txn &tx, Env &env, std::string_view id)
  {
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env.idKeys(), key_id(id), v))
      return std::nullopt;
    if (v.mv_size != 8)
      throw MdbError("corrupt interned key value");
    return read_be64(static_cast<const unsigned char *>(v.mv_data));
  }

  static void write_key_id_pair(Txn &tx, Env &env, uint64_t keyId, std::string_view id)
  {
    auto kk = key_interned_be(keyId);
    mdb_put_val(tx.get(), env.keyIds(), kk, id);
    mdb_put_val(tx.get(), env.idKeys(), key_id(id), kk);
  }

  static constexpr uint32_t kSchemaVersion = 1;

  // entries copied out per read transaction in rangeIterate
  static constexpr size_t kRangeBatch = 256;

  static const std::filesystem::path &ensure_dir(const std::filesystem::path &dir)
  {
    std::filesystem::create_directories(dir);
    return dir;
  }

  // -------------------- api ---------------------------

  LmdbBackend::LmdbBackend(const LmdbOptions &options)
      : options_(options),
        env_(ensure_dir(options.path), options.mapSizeBytes)
  {
    maxKeySize_ = static_cast<size_t>(mdb_env_get_maxkeysize(env_.raw()));
    ensureKeyMode();
  }

  void LmdbBackend::ensureKeyMode()
  {
    Txn tx(env_.raw(), true);
    const uint32_t wanted = options_.internKeys ? 1u : 0u;
    auto mode = read_u32(tx.get(), env_.meta(), key_meta_key_mode());
    if (!mode)
    {
      write_u32(tx.get(), env_.meta(), key_meta_schema_version(), kSchemaVersion);
      write_u32(tx.get(), env_.meta(), key_meta_key_mode(), wanted);
      tx.commit();
      return;
    }
    auto version = read_u32(tx.get(), env_.meta(), key_meta_schema_version());
    if (version != kSchemaVersion)
      throw MdbError("unsupported schema version " + (version ? std::to_string(*version) : std::string("(missing)")));
    if (*mode != wanted)
      throw MdbError(*mode ? "database was created with key interning enabled"
                           : "database was created without key interning");
  }

  std::optional<std::string> LmdbBackend::storageKey(Txn &tx, std::string_view key)
  {
    if (!storable(key))
      return std::nullopt;
    if (!options_.internKeys)
      return std::string(key);
    auto id = lookup_key_id(tx, env_, key);
    if (!id)
      return std::nullopt;
    return key_interned_be(*id);
  }

  std::string LmdbBackend::storageKeyForWrite(Txn &tx, std::string_view key)
  {
    if (!storable(key))
      throw MdbError("key is empty or longer than " + std::to_string(maxKeySize_) + " bytes");
    if (!options_.internKeys)
      return std::string(key);
    if (auto id = lookup_key_id(tx, env_, key))
      return key_interned_be(*id);
    uint64_t id = incr_meta_seq(tx, env_, key_meta_key_seq());
    write_key_id_pair(tx, env_, id, key);
    return key_interned_be(id);
  }

  std::string LmdbBackend::originalKey(Txn &tx, std::string_view stored)
  {
    if (!options_.internKeys)
      return std::string(stored);
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env_.keyIds(), stored, v))
      throw MdbError("interned key has no dictionary entry");
    return std::string(view_of(v));
  }

  std::optional<uint64_t> LmdbBackend::internedKey(std::string_view key)
  {
    Txn tx(env_.raw(), false);
    if (!storable(key))
      return std::nullopt;
    return lookup_key_id(tx, env_, key);
  }

  std::optional<std::string> LmdbBackend::get(Partition p, std::string_view key)
  {
    Txn tx(env_.raw(), false);
    auto sk = storageKey(tx, key);
    if (!sk)
      return std::nullopt;
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env_.partition(p), *sk, v))
      return std::nullopt;
    return std::string(view_of(v));
  }

  void LmdbBackend::put(Partition p, std::string_view key, std::string_view value)
  {
    Txn tx(env_.raw(), true);
    auto sk = storageKeyForWrite(tx, key);
    mdb_put_val(tx.get(), env_.partition(p), sk, value);
    tx.commit();
  }

  void LmdbBackend::remove(Partition p, std::string_view key)
  {
    Txn tx(env_.raw(), true);
    auto sk = storageKey(tx, key);
    if (!sk)
      return;
    mdb_del_val(tx.get(), env_.partition(p), *sk);
    tx.commit();
  }

  KeyValueMap LmdbBackend::multiGet(Partition p, const std::vector<std::string> &keys)
  {
    KeyValueMap out;
    Txn tx(env_.raw(), false);
    auto dbi = env_.partition(p);
    for (const auto &key : keys)
    {
      auto sk = storageKey(tx, key);
      if (!sk)
        continue;
      MDB_val v{};
      if (mdb_get_val(tx.get(), dbi, *sk, v))
        out.emplace(key, std::string(view_of(v)));
    }
    return out;
  }

  void LmdbBackend::multiPut(Partition p, const KeyValueMap &entries)
  {
    if (entries.empty())
      return;
    Txn tx(env_.raw(), true);
    auto dbi = env_.partition(p);
    for (const auto &[key, value] : entries)
      mdb_put_val(tx.get(), dbi, storageKeyForWrite(tx, key), value);
    tx.commit();
    KJ_LOG(INFO, "multiPut committed", partitionName(p), entries.size());
  }

  void LmdbBackend::rangeIterate(Partition p, std::string_view start, std::string_view end, const RangeCallback &fn)
  {
    std::string resume; // stored key of the last entry read
    bool firstBatch = true;
    for (;;)
    {
      std::vector<std::pair<std::string, std::string>> batch;
      bool more = false;
      {
        Txn tx(env_.raw(), false);
        Cursor cur(tx, env_.partition(p));
        MDB_val k{}, v{};
        int rc = 0;
        if (!firstBatch)
        {
          k = make_val(resume);
          rc = mdb_cursor_get(cur.get(), &k, &v, MDB_SET_RANGE);
          if (rc == 0 && view_of(k) == resume)
            rc = mdb_cursor_get(cur.get(), &k, &v, MDB_NEXT);
        }
        // interned keys are ordered by allocation, so every entry has to be checked against the bounds
        else if (options_.internKeys || !storable(start))
        {
          rc = mdb_cursor_get(cur.get(), &k, &v, MDB_FIRST);
        }
        else
        {
          k = make_val(start);
          rc = mdb_cursor_get(cur.get(), &k, &v, MDB_SET_RANGE);
        }

        while (rc == 0)
        {
          std::string key = options_.internKeys ? originalKey(tx, view_of(k)) : std::string(view_of(k));
          if (!options_.internKeys && !end.empty() && key >= end)
            break;
          if (key >= start && (end.empty() || key < end))
            batch.emplace_back(std::move(key), std::string(view_of(v)));
          resume.assign(view_of(k));
          if (batch.size() >= kRangeBatch)
          {
            more = true;
            break;
          }
          rc = mdb_cursor_get(cur.get(), &k, &v, MDB_NEXT);
        }
        if (rc != 0 && rc != MDB_NOTFOUND)
          throw MdbError(mdb_strerror(rc));
      }

      for (const auto &[key, value] : batch)
        if (!fn(key, value))
          return;
      if (!more)
        return;
      firstBatch = false;
    }
  }

  void LmdbBackend::close()
  {
    if (!env_.isOpen())
      return;
    env_.close();
    KJ_LOG(INFO, "lmdb environment closed", options_.path.c_str());
  }

} // namespace graphkv
