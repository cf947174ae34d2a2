#include "env.hpp"
#include <lmdb.h>
#include <kj/debug.h>
#include <utility>

namespace graphkv
{

  Txn::Txn(MDB_env *env, bool rw) : env_(env), rw_(rw)
  {
    if (!env_)
      throw MdbError("lmdb environment is closed");
    int rc = mdb_txn_begin(env_, nullptr, rw_ ? 0 : MDB_RDONLY, &txn_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  Txn::~Txn() noexcept
  {
    if (txn_)
      mdb_txn_abort(txn_);
  }

  Txn::Txn(Txn &&other) noexcept : env_(other.env_), txn_(other.txn_), rw_(other.rw_)
  {
    other.txn_ = nullptr;
  }

  Txn &Txn::operator=(Txn &&other) noexcept
  {
    if (this != &other)
    {
      abort();
      env_ = other.env_;
      txn_ = other.txn_;
      rw_ = other.rw_;
      other.txn_ = nullptr;
    }
    return *this;
  }

  MDB_txn *Txn::get() const { return txn_; }

  void Txn::commit()
  {
    int rc = mdb_txn_commit(txn_);
    txn_ = nullptr;
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  void Txn::abort() noexcept
  {
    if (txn_)
    {
      mdb_txn_abort(txn_);
      txn_ = nullptr;
    }
  }

  Cursor::Cursor(Txn &tx, DbHandle dbi)
  {
    int rc = mdb_cursor_open(tx.get(), dbi, &cur_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  Cursor::~Cursor() noexcept
  {
    if (cur_)
      mdb_cursor_close(cur_);
  }

  Env::Env(const std::filesystem::path &path, size_t mapSizeBytes)
  {
    int rc = mdb_env_create(&env_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    mdb_env_set_maxdbs(env_, 8);
    mdb_env_set_mapsize(env_, mapSizeBytes);
    rc = mdb_env_open(env_, path.c_str(), 0, 0664);
    if (rc)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw MdbError(mdb_strerror(rc));
    }
    try
    {
      Txn tx(env_, true);
      open(tx.get(), nodes_, "nodes");
      open(tx.get(), edges_, "edges");
      open(tx.get(), adjacency_, "adjacency");

      open(tx.get(), idKeys_, "idKeys");
      open(tx.get(), keyIds_, "keyIds");
      open(tx.get(), meta_, "meta");
      tx.commit();
    }
    catch (const MdbError &)
    {
      close();
      throw;
    }
    KJ_LOG(INFO, "lmdb environment opened", path.c_str());
  }

  Env::~Env() noexcept
  {
    close();
  }

  Env::Env(Env &&other) noexcept
      : env_(other.env_),
        nodes_(other.nodes_),
        edges_(other.edges_),
        adjacency_(other.adjacency_),
        idKeys_(other.idKeys_),
        keyIds_(other.keyIds_),
        meta_(other.meta_)
  {
    other.env_ = nullptr;
  }

  Env &Env::operator=(Env &&other) noexcept
  {
    if (this != &other)
    {
      close();
      env_ = other.env_;
      nodes_ = other.nodes_;
      edges_ = other.edges_;
      adjacency_ = other.adjacency_;

      idKeys_ = other.idKeys_;
      keyIds_ = other.keyIds_;
      meta_ = other.meta_;
      other.env_ = nullptr;
    }
    return *this;
  }

  void Env::close() noexcept
  {
    if (env_)
    {
      mdb_env_close(env_);
      env_ = nullptr;
    }
  }

  MDB_env *Env::raw() const { return env_; }

  DbHandle Env::partition(Partition p) const
  {
    switch (p)
    {
    case Partition::Nodes:
      return nodes_;
    case Partition::Edges:
      return edges_;
    case Partition::Adjacency:
      return adjacency_;
    }
    throw MdbError("unknown partition");
  }

  DbHandle Env::idKeys() const { return idKeys_; }
  DbHandle Env::keyIds() const { return keyIds_; }
  DbHandle Env::meta() const { return meta_; }

  void Env::open(MDB_txn *tx, DbHandle &out, const char *name)
  {
    int rc = mdb_dbi_open(tx, name, MDB_CREATE, &out);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

} // namespace graphkv
