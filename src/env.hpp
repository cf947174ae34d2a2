#pragma once
#include "backend.hpp"
#include "errors.hpp"
#include <filesystem>

struct MDB_env;
struct MDB_txn;
struct MDB_cursor;
using DbHandle = unsigned int;

namespace graphkv
{

  struct MdbError : BackendError
  {
    using BackendError::BackendError;
  };

  class Txn
  {
  public:
    Txn(MDB_env *env, bool rw);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;
    Txn(Txn &&other) noexcept;
    Txn &operator=(Txn &&other) noexcept;

    MDB_txn *get() const;
    void commit();
    void abort() noexcept;

  private:
    MDB_env *env_{};
    MDB_txn *txn_{};
    bool rw_{};
  };

  // cursor scoped to a live transaction
  class Cursor
  {
  public:
    Cursor(Txn &tx, DbHandle dbi);
    ~Cursor() noexcept;
    Cursor(const Cursor &) = delete;
    Cursor &operator=(const Cursor &) = delete;

    MDB_cursor *get() const { return cur_; }

  private:
    MDB_cursor *cur_{};
  };

  // LMDB environment with one named database per partition plus the
  // key-interning dictionaries (idKeys: id -> u64, keyIds: u64 -> id) and meta.
  class Env
  {
  public:
    Env(const std::filesystem::path &path, size_t mapSizeBytes = size_t(1ull << 30));
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;
    Env(Env &&other) noexcept;
    Env &operator=(Env &&other) noexcept;

    MDB_env *raw() const;
    bool isOpen() const { return env_ != nullptr; }
    // releases the environment; no-op when already closed
    void close() noexcept;

    DbHandle partition(Partition p) const;

    DbHandle idKeys() const;
    DbHandle keyIds() const;
    DbHandle meta() const;

  private:
    static void open(MDB_txn *tx, DbHandle &out, const char *name);

    MDB_env *env_{};
    DbHandle nodes_{};
    DbHandle edges_{};
    DbHandle adjacency_{};

    DbHandle idKeys_{};
    DbHandle keyIds_{};
    DbHandle meta_{};
  };

} // namespace graphkv
