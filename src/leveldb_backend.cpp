#include "leveldb_backend.hpp"
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <kj/debug.h>

namespace graphkv
{
  // -------------------- key helpers --------------------

  static std::string_view partition_prefix(Partition p)
  {
    switch (p)
    {
    case Partition::Nodes:
      return "N:";
    case Partition::Edges:
      return "E:";
    case Partition::Adjacency:
      return "A:";
    }
    throw LevelDbError("unknown partition");
  }

  // <prefix><id>
  static std::string prefixed_key(Partition p, std::string_view key)
  {
    std::string k(partition_prefix(p));
    k.append(key.data(), key.size());
    return k;
  }

  static inline leveldb::Slice slice_of(std::string_view s)
  {
    return leveldb::Slice(s.data(), s.size());
  }

  static inline std::string_view view_of(const leveldb::Slice &s)
  {
    return std::string_view(s.data(), s.size());
  }

  static void check(const leveldb::Status &s)
  {
    if (!s.ok())
      throw LevelDbError(s.ToString());
  }

  namespace
  {
    struct SnapshotGuard
    {
      leveldb::DB &db;
      const leveldb::Snapshot *snapshot;

      explicit SnapshotGuard(leveldb::DB &d) : db(d), snapshot(d.GetSnapshot()) {}
      ~SnapshotGuard() { db.ReleaseSnapshot(snapshot); }
      SnapshotGuard(const SnapshotGuard &) = delete;
      SnapshotGuard &operator=(const SnapshotGuard &) = delete;
    };
  } // namespace

  // -------------------- api ---------------------------

  LevelDbBackend::LevelDbBackend(const LevelDbOptions &options) : options_(options)
  {
    std::filesystem::create_directories(options_.path);
    leveldb::Options opts;
    opts.create_if_missing = true;
    opts.write_buffer_size = options_.writeBufferBytes;
    leveldb::DB *raw = nullptr;
    check(leveldb::DB::Open(opts, options_.path.string(), &raw));
    db_.reset(raw);
    KJ_LOG(INFO, "leveldb database opened", options_.path.c_str());
  }

  LevelDbBackend::~LevelDbBackend() = default;

  leveldb::DB &LevelDbBackend::db()
  {
    if (!db_)
      throw LevelDbError("leveldb database is closed");
    return *db_;
  }

  std::optional<std::string> LevelDbBackend::get(Partition p, std::string_view key)
  {
    std::string value;
    auto s = db().Get(leveldb::ReadOptions(), prefixed_key(p, key), &value);
    if (s.IsNotFound())
      return std::nullopt;
    check(s);
    return value;
  }

  void LevelDbBackend::put(Partition p, std::string_view key, std::string_view value)
  {
    leveldb::WriteOptions wo;
    wo.sync = options_.sync;
    check(db().Put(wo, prefixed_key(p, key), slice_of(value)));
  }

  void LevelDbBackend::remove(Partition p, std::string_view key)
  {
    leveldb::WriteOptions wo;
    wo.sync = options_.sync;
    check(db().Delete(wo, prefixed_key(p, key)));
  }

  KeyValueMap LevelDbBackend::multiGet(Partition p, const std::vector<std::string> &keys)
  {
    auto &d = db();
    SnapshotGuard guard(d);
    leveldb::ReadOptions ro;
    ro.snapshot = guard.snapshot;

    KeyValueMap out;
    for (const auto &key : keys)
    {
      std::string value;
      auto s = d.Get(ro, prefixed_key(p, key), &value);
      if (s.IsNotFound())
        continue;
      check(s);
      out.emplace(key, std::move(value));
    }
    return out;
  }

  void LevelDbBackend::multiPut(Partition p, const KeyValueMap &entries)
  {
    if (entries.empty())
      return;
    leveldb::WriteBatch batch;
    for (const auto &[key, value] : entries)
      batch.Put(prefixed_key(p, key), value);
    leveldb::WriteOptions wo;
    wo.sync = options_.sync;
    check(db().Write(wo, &batch));
  }

  void LevelDbBackend::rangeIterate(Partition p, std::string_view start, std::string_view end, const RangeCallback &fn)
  {
    const auto prefix = partition_prefix(p);
    const std::string lo = prefixed_key(p, start);
    const std::string hi = end.empty() ? std::string() : prefixed_key(p, end);

    std::unique_ptr<leveldb::Iterator> it(db().NewIterator(leveldb::ReadOptions()));
    for (it->Seek(lo); it->Valid(); it->Next())
    {
      auto k = view_of(it->key());
      if (k.substr(0, prefix.size()) != prefix)
        break;
      if (!hi.empty() && k >= hi)
        break;
      if (!fn(k.substr(prefix.size()), view_of(it->value())))
        break;
    }
    check(it->status());
  }

  void LevelDbBackend::close()
  {
    if (!db_)
      return;
    db_.reset();
    KJ_LOG(INFO, "leveldb database closed", options_.path.c_str());
  }

} // namespace graphkv
